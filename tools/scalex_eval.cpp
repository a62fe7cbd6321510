#include <scalex/scalex.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

auto parse_type(std::string_view name) -> std::optional<scalex::FieldType> {
    using scalex::TypeCode;
    if (name == "int") {
        return scalex::new_field_type(TypeCode::LongLong);
    }
    if (name == "real") {
        return scalex::new_field_type(TypeCode::Double);
    }
    if (name == "decimal") {
        return scalex::new_field_type(TypeCode::NewDecimal);
    }
    if (name == "string") {
        return scalex::new_field_type(TypeCode::Varchar);
    }
    if (name == "datetime") {
        return scalex::new_field_type(TypeCode::Datetime);
    }
    if (name == "duration") {
        return scalex::new_field_type(TypeCode::Duration);
    }
    if (name == "unspecified") {
        return scalex::new_field_type(TypeCode::Unspecified);
    }
    return std::nullopt;
}

/// Integers, reals, `dec:<text>` decimals; anything else is a string.
auto parse_literal(const std::string& text) -> scalex::expression::ExprPtr {
    namespace ex = scalex::expression;
    if (text.starts_with("dec:")) {
        if (auto dec = scalex::Decimal::parse(std::string_view(text).substr(4))) {
            return ex::dec_lit(*dec);
        }
        return ex::str_lit(text);
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    std::int64_t int_value = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, int_value);
        ec == std::errc{} && ptr == last) {
        return ex::int_lit(int_value);
    }
    double real_value = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, real_value);
        ec == std::errc{} && ptr == last) {
        return ex::real_lit(real_value);
    }
    return ex::str_lit(text);
}

void set_log_level(bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::info);
    if (const char* env = std::getenv("SCALEX_LOG_LEVEL"); env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    }
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"scalex_eval: build and evaluate one scalar function call"};

    std::string function;
    std::vector<std::string> literals;
    std::string type_name = "unspecified";
    bool is_unsigned = false;
    bool no_fold = false;
    bool strict_div = false;
    bool verbose = false;
    std::int64_t tz_offset = 0;

    app.add_option("function", function, "Builtin function name")->required();
    app.add_option("args", literals, "Literal arguments");
    app.add_option("--type", type_name, "Declared return type")
        ->check(CLI::IsMember(
            {"int", "real", "decimal", "string", "datetime", "duration", "unspecified"}));
    app.add_flag("--unsigned", is_unsigned, "Mark the declared type unsigned");
    app.add_flag("--no-fold", no_fold, "Keep constant calls unevaluated");
    app.add_option("--tz-offset", tz_offset, "Session time zone offset in seconds");
    app.add_flag("--strict-div", strict_div, "Fail on division by zero");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    set_log_level(verbose);

    scalex::session::SessionVars vars;
    vars.time_zone_offset = std::chrono::seconds{tz_offset};
    vars.error_on_division_by_zero = strict_div;
    scalex::session::SessionContext ctx{vars};
    spdlog::debug("session: tz offset {}s, strict division {}", tz_offset, strict_div);

    auto ret_type = parse_type(type_name);
    if (ret_type && is_unsigned) {
        ret_type->flag |= scalex::type_flag::kUnsigned;
    }

    std::vector<scalex::expression::ExprPtr> args;
    args.reserve(literals.size());
    for (const auto& literal : literals) {
        args.push_back(parse_literal(literal));
    }

    auto expr = no_fold ? scalex::expression::new_function_base(ctx, function, ret_type,
                                                                std::move(args))
                        : scalex::expression::new_function(ctx, function, ret_type,
                                                           std::move(args));
    if (!expr) {
        fmt::print(stderr, "error: {}\n", expr.error().format());
        return 1;
    }

    const auto& node = **expr;
    fmt::print("expr:   {}\n", node.to_string());
    fmt::print("json:   {}\n", node.to_json());
    fmt::print("type:   {}\n", node.type().to_string());
    fmt::print("hash:   {}\n", scalex::codec::to_hex(node.hash_code(ctx.stmt())));
    fmt::print("folded: {}\n", node.kind() == scalex::expression::ExprKind::Constant);

    auto value = scalex::expression::eval_to_datum(node, scalex::chunk::Row{});
    if (!value) {
        fmt::print(stderr, "error: {}\n", value.error().format());
        return 1;
    }
    fmt::print("value:  {}\n", scalex::datum_to_string(*value));
    for (const auto& warning : ctx.stmt().warnings()) {
        fmt::print("warning: {}\n", warning.format());
    }
    return 0;
}
