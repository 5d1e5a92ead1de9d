#pragma once

#include "wim/Wim.hpp"

int cmd_capture(wim::Wim& w, int argc, char** argv);
