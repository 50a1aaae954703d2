#pragma once

#include "quicid/connection_ids.hpp"
#include "quicid/error.hpp"
#include "quicid/format.hpp"
#include "quicid/generator.hpp"
#include "quicid/hash.hpp"
#include "quicid/ngtcp2_hooks.hpp"
#include "quicid/opt.hpp"
#include "quicid/utils.hpp"
