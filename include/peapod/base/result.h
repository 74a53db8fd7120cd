#ifndef PEAPOD_BASE_RESULT_H
#define PEAPOD_BASE_RESULT_H

#include "peapod/base/error_code.h"
#include <utility>
#include <variant>

namespace peapod {

// Value-or-error return for fallible operations on untrusted input.
// Accessing value() on an error (or error() on a value) throws InternalError.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorCode code) : data_(std::in_place_index<1>, code) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & {
        check_value();
        return std::get<0>(data_);
    }

    const T& value() const& {
        check_value();
        return std::get<0>(data_);
    }

    T&& value() && {
        check_value();
        return std::get<0>(std::move(data_));
    }

    ErrorCode error() const {
        if (ok()) {
            throw PeaPodError(ErrorCode::InternalError, "error() called on a successful result");
        }
        return std::get<1>(data_);
    }

    std::error_code error_code() const {
        return ok() ? std::error_code() : make_error_code(std::get<1>(data_));
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    void check_value() const {
        if (!ok()) {
            throw PeaPodError(std::get<1>(data_), "value() called on a failed result");
        }
    }

    std::variant<T, ErrorCode> data_;
};

} // namespace peapod

#endif // PEAPOD_BASE_RESULT_H
