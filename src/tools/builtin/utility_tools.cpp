#include "toolroute/tools/builtin.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

namespace toolroute::tools::builtin {

namespace {

// expr   := term (('+' | '-') term)*
// term   := power (('*' | '/' | '%') power)*
// power  := unary ('^' power)?
// unary  := '-' unary | '+' unary | primary
// primary:= number | '(' expr ')'
class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    Result<double, Error> parse() {
        auto value = expr();
        if (error_) {
            return Result<double, Error>::err(*error_);
        }
        skip_space();
        if (pos_ != text_.size()) {
            return fail_at("Unexpected character");
        }
        if (!std::isfinite(value)) {
            return Result<double, Error>::err(Error::with_details(
                ErrorCode::ExecError, "Result is not a finite number",
                Json{{"expression", text_}}));
        }
        return Result<double, Error>::ok(value);
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    int depth_ = 0;
    std::optional<Error> error_;

    Result<double, Error> fail_at(const std::string& message) {
        return Result<double, Error>::err(Error::with_details(
            ErrorCode::ValidationError, message,
            Json{{"field", "expression"}, {"position", pos_}}));
    }

    double fail(const std::string& message) {
        if (!error_) {
            error_ = Error::with_details(ErrorCode::ValidationError, message,
                                         Json{{"field", "expression"}, {"position", pos_}});
        }
        return 0.0;
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool accept(char c) {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    double expr() {
        double value = term();
        while (!error_) {
            if (accept('+')) {
                value += term();
            } else if (accept('-')) {
                value -= term();
            } else {
                break;
            }
        }
        return value;
    }

    double term() {
        double value = power();
        while (!error_) {
            if (accept('*')) {
                value *= power();
            } else if (accept('/')) {
                double rhs = power();
                if (rhs == 0.0) return fail("Division by zero");
                value /= rhs;
            } else if (accept('%')) {
                double rhs = power();
                if (rhs == 0.0) return fail("Division by zero");
                value = std::fmod(value, rhs);
            } else {
                break;
            }
        }
        return value;
    }

    double power() {
        double base = unary();
        if (!error_ && accept('^')) {
            return std::pow(base, power());
        }
        return base;
    }

    double unary() {
        if (++depth_ > 64) return fail("Expression nested too deeply");
        double value;
        if (accept('-')) {
            value = -unary();
        } else if (accept('+')) {
            value = unary();
        } else {
            value = primary();
        }
        --depth_;
        return value;
    }

    double primary() {
        if (accept('(')) {
            double value = expr();
            if (!error_ && !accept(')')) return fail("Missing closing parenthesis");
            return value;
        }

        skip_space();
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
            ++pos_;
        }
        if (start == pos_) return fail("Expected a number");

        try {
            size_t used = 0;
            std::string token = text_.substr(start, pos_ - start);
            double value = std::stod(token, &used);
            if (used != token.size()) return fail("Malformed number");
            return value;
        } catch (const std::exception&) {
            return fail("Malformed number");
        }
    }
};

ToolResult calculate_handler(const Json& args, const ExecutorContext&) {
    std::string expression = args.at("expression").get<std::string>();

    auto value = evaluate_expression(expression);
    if (value.is_err()) {
        return ToolResult::failure(std::move(value).error());
    }

    double v = value.value();
    Json result{{"expression", expression}};
    if (std::floor(v) == v && std::fabs(v) < 9.0e15) {
        result["value"] = static_cast<int64_t>(v);
    } else {
        result["value"] = v;
    }
    return ToolResult::success(result);
}

ToolResult get_time_handler(const Json&, const ExecutorContext& ctx) {
    auto now = ctx.started_at();
    std::time_t t = Clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S %Z");

    return ToolResult::success(Json{
        {"iso", format_timestamp(now)},
        {"local", ss.str()},
        {"unix", static_cast<int64_t>(t)}
    });
}

}  // namespace

Result<double, Error> evaluate_expression(const std::string& expression) {
    if (expression.size() > 1000) {
        return Result<double, Error>::err(Error::with_details(
            ErrorCode::ValidationError, "Expression is too long", Json{{"field", "expression"}}));
    }
    ExpressionParser parser(expression);
    return parser.parse();
}

void register_utility_tools(ToolRegistryBuilder& builder) {
    builder.add_builtin(
        ToolSpec{
            .name = "calculate",
            .description = "Evaluate an arithmetic expression.",
            .parameters = {
                {"expression", "Expression using + - * / % ^ and parentheses", ParamType::String, true}
            },
            .keywords = {"calculate", "calc", "math", "compute", "evaluate"}
        },
        calculate_handler
    );

    builder.add_builtin(
        ToolSpec{
            .name = "get_time",
            .description = "Current date and time.",
            .parameters = {},
            .keywords = {"time", "date", "clock", "now", "today"}
        },
        get_time_handler
    );
}

}  // namespace toolroute::tools::builtin
