#pragma once

#include "wim/Wim.hpp"

int cmd_dir(wim::Wim& w, int argc, char** argv);
