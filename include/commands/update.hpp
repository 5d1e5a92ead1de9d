#pragma once

#include "wim/Wim.hpp"

int cmd_update(wim::Wim& w, int argc, char** argv);
