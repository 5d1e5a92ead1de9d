#pragma once

#include "wim/Wim.hpp"

int cmd_info(wim::Wim& w, int argc, char** argv);
