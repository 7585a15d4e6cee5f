#pragma once
#include "config/config.hpp"

struct Global {
    Config conf;
};

const Global& global();
const Config& config();
Config& set_config();
