#include "sharelink/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace sharelink::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::vector<std::byte> random_bytes(std::size_t count)
    {
        ensure_initialized_once();
        std::vector<std::byte> bytes(count);
        if (count > 0)
        {
            randombytes_buf(bytes.data(), bytes.size());
        }
        return bytes;
    }

    std::uint32_t random_uniform(std::uint32_t upper_bound)
    {
        ensure_initialized_once();
        if (upper_bound < 2)
        {
            return 0;
        }
        return randombytes_uniform(upper_bound);
    }

} // namespace sharelink::crypto
