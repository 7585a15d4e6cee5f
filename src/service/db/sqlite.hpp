#pragma once
#include "SQLiteCpp/SQLiteCpp.h"
#include "spdlog/spdlog.h"
#include "sqlite_fwd.hpp"
#include "type_conv.hpp"

namespace sqlite {
template <typename T>
Column::operator T() const
{
    try {
        T v = ColumnConverter(*this);
        return v;
    } catch (const std::exception& e) {
        spdlog::error("Database error, cannot convert value of column {}: {}", getName(), e.what());
        throw;
    }
}

inline Statement& Row::statement() const
{
    return st.get();
}
inline Column Row::operator[](int index) const
{
    value_assert();
    return statement().getColumn(index);
}

template <typename T>
inline T Row::get(int index) const
{
    return operator[](index);
}

template <typename T>
inline std::optional<T> Row::get_optional(int index) const
{
    auto c { operator[](index) };
    if (c.isNull())
        return {};
    T v = c;
    return v;
}

inline auto Row::process(auto lambda) const
{
    using ret_t = std::remove_cvref_t<decltype(lambda(*this))>;
    std::optional<ret_t> r;
    if (has_value())
        r = lambda(*this);
    return r;
}

inline void Row::value_assert() const
{
    if (!hasValue) {
        throw std::runtime_error(
            "Database error: trying to access empty result.");
    }
}
inline Row::Row(Statement& st)
    : st(st)
{
    hasValue = statement().executeStep();
}

inline Column Statement::getColumn(const int aIndex)
{
    return { SQLite::Statement::getColumn(aIndex) };
}

struct Binder {
    using Stmt = SQLite::Statement;
    Binder(Stmt& stmt)
        : stmt(stmt)
    {
    }
    void bind_param(int i, const auto& a)
    {
        stmt.bind(i, a);
    }
    void bind(int i, std::nullopt_t)
    {
        stmt.bind(i);
    }
    template <typename U>
    void bind(int i, const std::optional<U>& o)
    {
        if (o)
            bind(i, *o);
        else
            stmt.bind(i);
    }
    void bind(int i, const auto& a)
    {
        bind_param(i, bind_convert::convert(a));
    }
    Stmt& stmt;
};

template <typename T>
inline void Statement::bind(const int index, const T& t)
{
    Binder(*this).bind(index, t);
}

template <size_t i>
void Statement::recursive_bind()
{
}
template <size_t i, typename T, typename... Types>
void Statement::recursive_bind(T&& t, Types&&... types)
{
    bind(i, std::forward<T>(t));
    recursive_bind<i + 1>(std::forward<Types>(types)...);
}
template <typename... Types>
inline uint32_t Statement::run(Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    auto nchanged = exec();
    reset();
    assert(nchanged >= 0);
    return nchanged;
}

template <typename... Types, typename Lambda>
void Statement::for_each(Lambda lambda, Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    while (true) {
        auto r { next_row() };
        if (!r.has_value())
            break;
        lambda(r);
    }
    reset();
}
}
