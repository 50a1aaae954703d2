#include "utils.hpp"

#include <atomic>

#include "error.hpp"
#include "internal.hpp"

namespace quicid
{
    void logger_config(std::string out, log::Type type, log::Level reset)
    {
        static std::atomic<bool> run_once{false};

        if (not run_once.exchange(true))
        {
            oxen::log::add_sink(type, out);
            oxen::log::reset_level(reset);
        }
    }

    void fill_random(void* dest, size_t size, gnutls_rnd_level_t level)
    {
        if (size == 0)
            return;

        if (auto rv = gnutls_rnd(level, dest, size); rv != 0)
        {
            log::critical(log_cat, "Secure random source failed to produce {} bytes: {}", size, gnutls_strerror(rv));
            throw random_source_error{rv};
        }
    }

}  // namespace quicid
