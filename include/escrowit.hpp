#pragma once

// Single include for the whole library

#include "escrowit/escrowit.hpp"
