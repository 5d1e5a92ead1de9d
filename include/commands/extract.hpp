#pragma once

#include "wim/Wim.hpp"

int cmd_extract(wim::Wim& w, int argc, char** argv);
