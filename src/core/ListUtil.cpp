#include "ListUtil.h"

namespace UtilToolkit
{
    std::mt19937& ListUtil::threadRandom()
    {
        thread_local std::mt19937 engine(std::random_device{}());
        return engine;
    }

} // namespace UtilToolkit
