#pragma once
#include "general/errors.hpp"
#include "tl/expected.hpp"
#include <optional>
template <typename T>
struct Result : public tl::expected<T, ErrorMessage> {
    Result(tl::expected<T, ErrorMessage> t)
        : tl::expected<T, ErrorMessage>(std::move(t))
    {
    }
    Result(T t)
        : tl::expected<T, ErrorMessage>(std::move(t))
    {
    }
    Result(Error e)
        : tl::expected<T, ErrorMessage>(tl::make_unexpected(ErrorMessage(e)))
    {
    }
    Result(Error e, std::string message)
        : tl::expected<T, ErrorMessage>(tl::make_unexpected(ErrorMessage(e, std::move(message))))
    {
    }
    Result(ErrorMessage e)
        : tl::expected<T, ErrorMessage>(tl::make_unexpected(std::move(e)))
    {
    }
};

template <>
struct Result<void> : public tl::expected<void, ErrorMessage> {
    Result(tl::expected<void, ErrorMessage> t)
        : tl::expected<void, ErrorMessage>(std::move(t))
    {
    }
    Result() // for Result<void> default constructor
        : tl::expected<void, ErrorMessage>({})
    {
    }
    Result(Error e)
        : tl::expected<void, ErrorMessage>(tl::make_unexpected(ErrorMessage(e)))
    {
    }
    Result(Error e, std::string message)
        : tl::expected<void, ErrorMessage>(tl::make_unexpected(ErrorMessage(e, std::move(message))))
    {
    }
    Result(ErrorMessage e)
        : tl::expected<void, ErrorMessage>(tl::make_unexpected(std::move(e)))
    {
    }
};
