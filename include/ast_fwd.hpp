#pragma once

#include <ast_nodes.hpp>

#include <type_traits>
#include <variant>
#include <memory>

/// Needed to do std::visit
// https://en.cppreference.com/w/cpp/utility/variant/visit (16.10.19)
template<class... Ts> struct base_visitor : Ts... { using Ts::operator()...; };
template<class... Ts> base_visitor(Ts...) -> base_visitor<Ts...>;

template<typename F>
struct recursor
{
  recursor(F&& f) : f(f) {}

  template<typename T>
  auto operator()(const T& arg) -> std::invoke_result_t<F, recursor<F>&, const T&>
  { return f(*this, arg); }
private:
  F f;
};
template<typename F> recursor(F&&) -> recursor<F>;

template<typename S, typename F>
struct stateful_recursor
{
  stateful_recursor(S&& s, F&& f) : state(std::move(s)), f(f) {}

  template<typename T>
  auto operator()(const T& arg) -> std::invoke_result_t<F, stateful_recursor<S, F>&, const T&>
  { return f(*this, arg); }

  S state;
private:
  F f;
};
template<typename S, typename F> stateful_recursor(S&&, F&&) -> stateful_recursor<S, F>;
// see ast_printer.cpp and frame_layout.cpp for recursive visitors

namespace dson
{

// Nodes are only ever handed out through pointers to const, which is what
// makes a finished tree safe to share between threads.
template<typename T>
using rec_wrap_t = std::shared_ptr<const T>;

// literals
struct null_lit_;          using null_lit = rec_wrap_t<null_lit_>;
struct true_lit_;          using true_lit = rec_wrap_t<true_lit_>;
struct false_lit_;         using false_lit = rec_wrap_t<false_lit_>;
struct self_ref_;          using self_ref = rec_wrap_t<self_ref_>;
struct super_ref_;         using super_ref = rec_wrap_t<super_ref_>;
struct root_ref_;          using root_ref = rec_wrap_t<root_ref_>;
struct str_;               using str = rec_wrap_t<str_>;
struct num_;               using num = rec_wrap_t<num_>;

// references and aggregates
struct id_;                using id = rec_wrap_t<id_>;
struct arr_;               using arr = rec_wrap_t<arr_>;
struct obj_;               using obj = rec_wrap_t<obj_>;
struct obj_extend_;        using obj_extend = rec_wrap_t<obj_extend_>;
struct parened_;           using parened = rec_wrap_t<parened_>;

// operators
struct unary_op_;          using unary_op = rec_wrap_t<unary_op_>;
struct binary_op_;         using binary_op = rec_wrap_t<binary_op_>;

// control and binding
struct assert_expr_;       using assert_expr = rec_wrap_t<assert_expr_>;
struct local_expr_;        using local_expr = rec_wrap_t<local_expr_>;
struct if_else_;           using if_else = rec_wrap_t<if_else_>;
struct error_expr_;        using error_expr = rec_wrap_t<error_expr_>;
struct function_;          using function = rec_wrap_t<function_>;
struct apply_;             using apply = rec_wrap_t<apply_>;

// access
struct select_;            using select = rec_wrap_t<select_>;
struct lookup_;            using lookup = rec_wrap_t<lookup_>;
struct slice_;             using slice = rec_wrap_t<slice_>;

// imports
struct import_;            using import = rec_wrap_t<import_>;
struct import_str_;        using import_str = rec_wrap_t<import_str_>;

// comprehensions
struct if_spec_;           using if_spec = rec_wrap_t<if_spec_>;
struct for_spec_;          using for_spec = rec_wrap_t<for_spec_>;
struct comp_;              using comp = rec_wrap_t<comp_>;

// Closed set of alternatives, every visitor handles all of them.
using expr = std::variant<
        null_lit,
        true_lit,
        false_lit,
        self_ref,
        super_ref,
        root_ref,
        str,
        num,
        id,
        arr,
        obj,
        obj_extend,
        parened,
        unary_op,
        binary_op,
        assert_expr,
        local_expr,
        if_else,
        error_expr,
        function,
        apply,
        select,
        lookup,
        slice,
        import,
        import_str,
        if_spec,
        for_spec,
        comp
>;

using comp_spec = std::variant<if_spec, for_spec>;

// object bodies
struct fixed_name;
struct dyn_name;
using field_name = std::variant<fixed_name, dyn_name>;

struct field;
struct bind_stmt;
struct assert_stmt;
using member = std::variant<field, bind_stmt, assert_stmt>;

class member_list;
struct obj_comp;
using obj_body = std::variant<member_list, obj_comp>;

class params;
struct bind;
struct arg;

}
