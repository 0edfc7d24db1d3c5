#ifndef INCLUDE_PEPPERHASH_ENCODER_ENCODERERRORS_HPP
#define INCLUDE_PEPPERHASH_ENCODER_ENCODERERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <variant>

namespace pepperhash::encoder
{

// Bad encoder options. Thrown from constructors and factories only.
class ConfigError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Unknown cipher, unknown key id or unusable ciphertext.
class DecryptError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class EncoderError : std::uint8_t
{
    HashFailed,
    DecryptFailed,
};

template <class T> using EncoderResult = std::variant<T, EncoderError>;

} // namespace pepperhash::encoder

#endif // INCLUDE_PEPPERHASH_ENCODER_ENCODERERRORS_HPP
