#ifndef DEFINITIONS_H
#define DEFINITIONS_H

#include <string>

namespace Definitions {

// --- Temporary Directories ---

// Names are "<epoch millis><separator><counter>", counter in [0, TEMP_DIR_ATTEMPTS).
const int TEMP_DIR_ATTEMPTS = 10000;
const std::string TEMP_DIR_SEPARATOR = "-";

} // namespace Definitions

#endif // DEFINITIONS_H
