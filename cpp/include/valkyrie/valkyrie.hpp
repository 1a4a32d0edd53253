#pragma once

#include "valkyrie/compressor.hpp"
#include "valkyrie/config.hpp"
#include "valkyrie/constants.hpp"
#include "valkyrie/container.hpp"
#include "valkyrie/crypto.hpp"
#include "valkyrie/env.hpp"
#include "valkyrie/errors.hpp"
#include "valkyrie/format.hpp"
#include "valkyrie/hex.hpp"
#include "valkyrie/kdf.hpp"
#include "valkyrie/log.hpp"
#include "valkyrie/package.hpp"
#include "valkyrie/tools.hpp"
