#ifndef RESULT_HPP
#define RESULT_HPP

#include <string>
#include <utility>

// Outcome of an archive operation.
// A plain "not found" is success == false with an empty error; the error
// string is only filled for real faults (I/O, collisions, corrupt data).
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    Result() : success(false), value(), error() {}
    Result(bool success_, T value_, std::string error_ = std::string())
        : success(success_), value(std::move(value_)), error(std::move(error_)) {}

    bool hasError() const { return !error.empty(); }

    static Result ok(T value_) { return Result(true, std::move(value_)); }
    static Result notFound() { return Result(false, T()); }
    static Result fail(const std::string& message) { return Result(false, T(), message); }
};

#endif
