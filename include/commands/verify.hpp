#pragma once

#include "wim/Wim.hpp"

int cmd_verify(wim::Wim& w, int argc, char** argv);
