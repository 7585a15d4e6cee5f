#include "globals.hpp"

namespace {
Global globalinstance;
}

const Global& global()
{
    return globalinstance;
}

const Config& config()
{
    return globalinstance.conf;
}

Config& set_config()
{
    return globalinstance.conf;
}
