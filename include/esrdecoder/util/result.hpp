#pragma once

#include "esrdecoder/decode_error.hpp"

#include <cassert>
#include <utility>
#include <variant>

namespace esrdecoder {

// Either a successfully decoded value or the error that aborted decoding.
template <typename T>
class Result {
public:
    Result(T value)
        : m_storage(std::in_place_index<0>, std::move(value)) {}

    Result(DecodeError error)
        : m_storage(std::in_place_index<1>, error) {}

    bool IsOk() const {
        return m_storage.index() == 0;
    }

    explicit operator bool() const {
        return IsOk();
    }

    T &Value() & {
        assert(IsOk());
        return std::get<0>(m_storage);
    }

    const T &Value() const & {
        assert(IsOk());
        return std::get<0>(m_storage);
    }

    T &&Value() && {
        assert(IsOk());
        return std::get<0>(std::move(m_storage));
    }

    const DecodeError &Error() const {
        assert(!IsOk());
        return std::get<1>(m_storage);
    }

    bool operator==(const Result &) const = default;

private:
    std::variant<T, DecodeError> m_storage;
};

} // namespace esrdecoder

// Evaluates `expr`, which must produce a Result. On failure, returns the error from the enclosing function; otherwise
// declares `var` holding the value.
#define ESRDECODER_TRY(var, expr)            \
    auto var##Result = (expr);               \
    if (!var##Result) {                      \
        return var##Result.Error();          \
    }                                        \
    auto var = std::move(var##Result).Value()
