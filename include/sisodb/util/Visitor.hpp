#pragma once

#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/macro.hpp>
#include <type_traits>


namespace siso {

/** Exception class which can be thrown to stop entire recursion in visitors. */
struct visit_stop_recursion { };

namespace detail {

/**
 * Visitor base class, using CRTP.
 *
 * \tparam ConcreteVisitor is the actual type of the visitor, \tparam Base is the base type of the class hierarchy to
 * visit.
 */
template<typename ConcreteVisitor, typename Base>
struct Visitor
{
    /** Whether the visited objects are `const`-qualified. */
    static constexpr bool is_const = std::is_const_v<Base>;

    /** The base class of the class hierarchy to visit. */
    using base_type = Base;

    /** The concrete type of the visitor.  Uses the CRTP design. */
    using visitor_type = ConcreteVisitor;

    /** A helper type to apply the proper `const`-qualification to parameters. */
    template<typename T>
    using Const = std::conditional_t<is_const, const T, T>;

    /** Make `Visitor` inheritable from. */
    virtual ~Visitor() { }

    visitor_type & actual() { return *static_cast<visitor_type*>(this); }

    /** Visit the object `obj`. */
    virtual void operator()(base_type &obj) { obj.accept(actual()); }
};

}

/*----- Declare a visitor to visit the class hierarchy with the given base class and list of subclasses. -------------*/
#define S_DECLARE_VISIT_METHOD(CLASS) virtual void operator()(Const<CLASS>&) { };
#define S_DECLARE_VISITOR(VISITOR_NAME, BASE_CLASS, CLASS_LIST) \
    struct S_EXPORT VISITOR_NAME : ::siso::detail::Visitor<VISITOR_NAME, BASE_CLASS> \
    { \
        using super = ::siso::detail::Visitor<VISITOR_NAME, BASE_CLASS>; \
        template<typename T> using Const = typename super::template Const<T>; \
        virtual ~VISITOR_NAME() {} \
        void operator()(BASE_CLASS &obj) { obj.accept(*this); } \
        CLASS_LIST(S_DECLARE_VISIT_METHOD) \
    };

}
