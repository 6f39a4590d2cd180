/**
 * @file
 * @brief Compress a save file (clean filter).
 */
#include "conv_tool.hpp"

int doMain(int argc, char *argv[])
{
    return dfcmpr::runConvTool(argc, argv, true);
}

DEFINE_ERROR_SAFE_MAIN("dfcompress")
