#pragma once
#include <cstdint>
#include <string>
struct Error { // error class for exceptions
    constexpr Error(int32_t e = 0)
        : code(e) { };
    const char* strerror() const;
    const char* err_name() const;
    std::string format() const;
    bool is_error() const { return code != 0; }
    operator bool() const { return is_error(); }
    operator int() const { return code; }
    int32_t code;
    static const Error none;
};
inline constexpr const Error Error::none { 0 };

// error code together with a human readable message
struct ErrorMessage : public Error {
    ErrorMessage(Error e)
        : Error(e)
        , message(e.strerror())
    {
    }
    ErrorMessage(Error e, std::string message)
        : Error(e)
        , message(std::move(message))
    {
    }
    std::string error_code() const { return err_name(); }
    std::string message;
};
