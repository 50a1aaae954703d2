#pragma once

#include <cstddef>
#include <oxen/log.hpp>
#include <oxen/log/format.hpp>

#include "format.hpp"
#include "utils.hpp"

namespace quicid
{
    inline auto log_cat = oxen::log::Cat("quicid");

    namespace log = oxen::log;

    using namespace log::literals;

    void logger_config(std::string out = "stderr", log::Type type = log::Type::Print, log::Level reset = log::Level::trace);

}  // namespace quicid
