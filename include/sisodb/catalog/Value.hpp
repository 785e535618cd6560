#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/macro.hpp>
#include <string>
#include <variant>


namespace siso {

/** This class holds a single attribute value.  Unlike a SQL value of a fixed type, a `Value` carries its own kind,
 * which is inferred from the literal it was created from.  A `Value` **can** represent `NULL`. */
struct S_EXPORT Value
{
    friend std::hash<Value>;

    enum kind_t {
        V_Null,
        V_Integer,
        V_Real,
        V_String,
    };

    private:
    std::variant<std::monostate, int64_t, double, std::string> val_;

    public:
    Value() = default;
    Value(int val) : val_(int64_t(val)) { }
    Value(int64_t val) : val_(val) { }
    Value(double val) : val_(val) { }
    Value(std::string val) : val_(std::move(val)) { }
    Value(const char *val) : val_(std::string(S_notnull(val))) { }

    static Value Null() { return Value(); }

    /** Infers a `Value` from the textual representation of a literal: `NULL` (case-insensitive) becomes `NULL`,
     * optionally signed integers and decimals become numbers, quoted text has its quotes removed, and everything else
     * is taken as a string. */
    static Value Infer(const std::string &literal);

    kind_t kind() const { return kind_t(val_.index()); }

    bool is_null() const { return kind() == V_Null; }
    bool is_integer() const { return kind() == V_Integer; }
    bool is_real() const { return kind() == V_Real; }
    bool is_string() const { return kind() == V_String; }

    int64_t as_i() const { S_insist(is_integer()); return std::get<int64_t>(val_); }
    double as_d() const { S_insist(is_real()); return std::get<double>(val_); }
    const std::string & as_s() const { S_insist(is_string()); return std::get<std::string>(val_); }

    /** Returns `true` iff this `Value` is a number or a string that entirely denotes a decimal number. */
    bool is_numeric() const;
    /** Returns the numeric interpretation of this `Value`.  Requires `is_numeric()`. */
    double to_double() const;

    /** Renders the value as text.  `NULL` is rendered as `NULL`, reals with up to 15 significant digits. */
    std::string to_string() const;

    /** Structural equality: two `Value`s are equal iff they are of the same kind and hold the same value. */
    bool operator==(const Value &other) const { return this->val_ == other.val_; }
    bool operator!=(const Value &other) const { return not operator==(other); }

S_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const Value &value) { return out << value.to_string(); }

    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

/** Three-way comparison of two non-`NULL` values.  Compares numerically if both values are numeric, otherwise compares
 * the textual renderings bytewise.  Returns a negative number, zero, or a positive number. */
int S_EXPORT compare(const Value &left, const Value &right);

}

namespace std {

/** Specializes `std::hash<T>` for `siso::Value`. */
template<>
struct hash<siso::Value>
{
    std::size_t operator()(const siso::Value &value) const {
        return std::hash<std::variant<std::monostate, int64_t, double, std::string>>{}(value.val_);
    }
};

}
