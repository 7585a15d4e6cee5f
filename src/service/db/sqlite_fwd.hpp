#pragma once
#include "SQLiteCpp/Column.h"
#include "SQLiteCpp/Statement.h"
#include <cassert>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace sqlite {
struct Column : public SQLite::Column {
    template <typename T>
    operator T() const;
};

class Statement;
class Row {

private: // data
    std::reference_wrapper<Statement> st;
    bool hasValue;

public:
    friend class Statement;
    Column operator[](int index) const;
    template <typename T>
    T get(int index) const;
    template <typename T>
    std::optional<T> get_optional(int index) const;
    bool has_value() const { return hasValue; }
    auto process(auto lambda) const;

private:
    void value_assert() const;
    Row(Statement& st);
    Statement& statement() const;
};

class Statement : public SQLite::Statement {
public:
    using SQLite::Statement::Statement;
    Column getColumn(const int aIndex);
    template <typename T>
    void bind(const int index, const T&);
    template <size_t i>
    void recursive_bind();
    template <size_t i, typename T, typename... Types>
    void recursive_bind(T&& t, Types&&... types);
    template <typename... Types>
    auto& bind_multiple(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return *this;
    }
    template <typename... Types>
    uint32_t run(Types&&... types);
    Row next_row() { return *this; }

    struct SingleResult : public Row {
        using Row::Row;
        ~SingleResult()
        {
            if (hasValue)
                assert(statement().executeStep() == false);
            statement().reset();
        }
    };

    template <typename... Types>
    [[nodiscard]] SingleResult one(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return SingleResult { *this };
    }

    template <typename... Types, typename Lambda>
    void for_each(Lambda lambda, Types&&... types);

    template <typename... Types, typename Lambda>
    [[nodiscard]] auto all(Lambda lambda, Types&&... types)
    {
        using ret_t = decltype(lambda(next_row()));
        std::vector<ret_t> res;
        for_each([&](const auto& row) {
            res.push_back(lambda(row));
        },
            types...);
        return res;
    }
};

}
