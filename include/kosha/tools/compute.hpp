#pragma once
// Compute tools: calculate_compound_interest, analyze_investment_returns, calculate
//
// Pure functions of their arguments. Bad input is an InvalidArgumentError
// naming the parameter; nothing here touches the network or the store.

#include "../dispatcher.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace kosha::tools::compute {

using json = nlohmann::json;

// $1,234,567.89
inline std::string format_money(double amount) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f", std::fabs(amount));
    std::string digits(buf);
    size_t dot = digits.find('.');
    std::string whole = digits.substr(0, dot);
    std::string grouped;
    for (size_t i = 0; i < whole.size(); ++i) {
        if (i > 0 && (whole.size() - i) % 3 == 0) grouped += ',';
        grouped += whole[i];
    }
    // -0.004 rounds to 0.00, printed without a sign
    bool negative = amount < 0 && digits != "0.00";
    return (negative ? "-$" : "$") + grouped + digits.substr(dot);
}

inline std::string format_percent(double pct) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f%%", pct);
    return buf;
}

// Shortest natural rendering: 5, 2.5, 0.125
inline std::string format_number(double x) {
    char buf[64];
    if (std::trunc(x) == x && std::fabs(x) < 1e15) {
        snprintf(buf, sizeof(buf), "%.0f", x);
    } else {
        snprintf(buf, sizeof(buf), "%.10g", x);
    }
    return buf;
}

// ═══════════════════════════════════════════════════════════════════
// Arithmetic evaluator
// ═══════════════════════════════════════════════════════════════════

// Recursive descent over numbers, + - * / % **, unary sign, parentheses.
//   expr  := term (('+' | '-') term)*
//   term  := unary (('*' | '/' | '%') unary)*
//   unary := ('+' | '-') unary | power
//   power := primary ('**' unary)?
// ** binds tighter than a leading sign and associates right: -2**2 = -4.
class Calculator {
public:
    static constexpr size_t MAX_LENGTH = 1000;
    static constexpr int MAX_DEPTH = 64;

    static double evaluate(const std::string& expression) {
        if (expression.size() > MAX_LENGTH) {
            fail("expression is longer than " + std::to_string(MAX_LENGTH) + " characters");
        }
        Calculator c(expression);
        c.skip_space();
        if (c.at_end()) fail("expression is empty");
        double v = c.expr();
        c.skip_space();
        if (!c.at_end()) {
            fail("unexpected '" + std::string(1, c.peek()) + "' at position " + std::to_string(c.pos_));
        }
        if (!std::isfinite(v)) fail("result is not a finite number");
        return v;
    }

private:
    explicit Calculator(const std::string& s) : s_(s) {}

    [[noreturn]] static void fail(const std::string& message) {
        throw InvalidArgumentError("expression", message);
    }

    bool at_end() const { return pos_ >= s_.size(); }
    char peek() const { return at_end() ? '\0' : s_[pos_]; }

    void skip_space() {
        while (!at_end() && (s_[pos_] == ' ' || s_[pos_] == '\t')) ++pos_;
    }

    bool match(const char* tok) {
        skip_space();
        size_t n = std::char_traits<char>::length(tok);
        if (s_.compare(pos_, n, tok) != 0) return false;
        // "*" must not eat the first half of "**"
        if (n == 1 && tok[0] == '*' && s_.compare(pos_, 2, "**") == 0) return false;
        pos_ += n;
        return true;
    }

    double expr() {
        double v = term();
        for (;;) {
            if (match("+")) v += term();
            else if (match("-")) v -= term();
            else return v;
        }
    }

    double term() {
        double v = unary();
        for (;;) {
            if (match("*")) {
                v *= unary();
            } else if (match("/")) {
                double d = unary();
                if (d == 0.0) fail("division by zero");
                v /= d;
            } else if (match("%")) {
                double d = unary();
                if (d == 0.0) fail("modulo by zero");
                double r = std::fmod(v, d);
                if (r != 0.0 && ((r < 0) != (d < 0))) r += d;  // Sign follows the divisor
                v = r;
            } else {
                return v;
            }
        }
    }

    double unary() {
        if (match("-")) return -nested([this] { return unary(); });
        if (match("+")) return nested([this] { return unary(); });
        return power();
    }

    double power() {
        double base = primary();
        if (match("**")) {
            double exp = nested([this] { return unary(); });
            if (base == 0.0 && exp < 0) fail("zero cannot be raised to a negative power");
            double v = std::pow(base, exp);
            if (std::isnan(v)) fail("power has no real result");
            return v;
        }
        return base;
    }

    double primary() {
        skip_space();
        if (match("(")) {
            double v = nested([this] { return expr(); });
            if (!match(")")) fail("missing ')' at position " + std::to_string(pos_));
            return v;
        }
        return number();
    }

    double number() {
        size_t start = pos_;
        bool dot = false;
        while (!at_end() && (std::isdigit(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '.')) {
            if (s_[pos_] == '.') {
                if (dot) fail("malformed number at position " + std::to_string(start));
                dot = true;
            }
            ++pos_;
        }
        if (pos_ == start) {
            if (at_end()) fail("expression ends unexpectedly");
            fail("unexpected '" + std::string(1, s_[pos_]) + "' at position " + std::to_string(pos_));
        }
        std::string lit = s_.substr(start, pos_ - start);
        if (lit == ".") fail("malformed number at position " + std::to_string(start));
        return std::strtod(lit.c_str(), nullptr);
    }

    template<typename F>
    double nested(F&& f) {
        if (++depth_ > MAX_DEPTH) fail("expression is nested too deeply");
        double v = f();
        --depth_;
        return v;
    }

    const std::string& s_;
    size_t pos_ = 0;
    int depth_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
// Tool implementations
// ═══════════════════════════════════════════════════════════════════

inline ToolOutput calculate_compound_interest(const json& params) {
    double principal = params.at("principal").get<double>();
    double rate = params.at("rate").get<double>();
    double time = params.at("time").get<double>();
    int64_t n = params.contains("compounds_per_year") ? params["compounds_per_year"].get<int64_t>() : 12;

    if (n <= 0) throw InvalidArgumentError("compounds_per_year", "compounds_per_year must be positive");
    if (principal <= 0) throw InvalidArgumentError("principal", "principal must be positive");
    if (time < 0) throw InvalidArgumentError("time", "time must not be negative");

    double amount = principal * std::pow(1.0 + rate / 100.0 / n, static_cast<double>(n) * time);
    if (!std::isfinite(amount)) {
        throw InvalidArgumentError("rate", "rate produces no finite result over this period");
    }
    double interest = amount - principal;
    double total_return_pct = interest / principal * 100.0;

    std::ostringstream ss;
    ss << "Compound Interest Calculation:\n"
       << "- Principal Amount: " << format_money(principal) << "\n"
       << "- Annual Interest Rate: " << format_number(rate) << "%\n"
       << "- Time Period: " << format_number(time) << " years\n"
       << "- Compounding Frequency: " << n << " times per year\n"
       << "\n"
       << "Final Amount: " << format_money(amount) << "\n"
       << "Interest Earned: " << format_money(interest) << "\n"
       << "Total Return: " << format_percent(total_return_pct);

    ToolOutput out;
    out.text = ss.str();
    out.structured = {
        {"amount", std::round(amount * 100.0) / 100.0},
        {"interest", std::round(interest * 100.0) / 100.0},
        {"total_return_pct", std::round(total_return_pct * 100.0) / 100.0},
        {"compounds_per_year", n}
    };
    return out;
}

inline ToolOutput analyze_investment_returns(const json& params) {
    double initial = params.at("initial").get<double>();
    double final_value = params.at("final").get<double>();
    double years = params.at("years").get<double>();

    if (initial <= 0) throw InvalidArgumentError("initial", "initial investment must be positive");
    if (years <= 0) throw InvalidArgumentError("years", "years must be positive");
    if (final_value < 0) throw InvalidArgumentError("final", "final value must not be negative");

    double total_return = final_value - initial;
    double total_return_pct = total_return / initial * 100.0;
    double cagr = (std::pow(final_value / initial, 1.0 / years) - 1.0) * 100.0;
    double average_annual = total_return_pct / years;

    std::ostringstream ss;
    ss << "Investment Return Analysis:\n"
       << "- Initial Investment: " << format_money(initial) << "\n"
       << "- Final Value: " << format_money(final_value) << "\n"
       << "- Time Period: " << format_number(years) << " years\n"
       << "\n"
       << "Total Return: " << format_money(total_return) << " (" << format_percent(total_return_pct) << ")\n"
       << "Compound Annual Growth Rate (CAGR): " << format_percent(cagr) << "\n"
       << "Average Annual Return: " << format_percent(average_annual) << " per year";

    ToolOutput out;
    out.text = ss.str();
    out.structured = {
        {"total_return", total_return},
        {"total_return_pct", total_return_pct},
        {"cagr_pct", cagr},
        {"average_annual_return_pct", average_annual}
    };
    return out;
}

inline ToolOutput calculate(const json& params) {
    std::string expression = params.at("expression").get<std::string>();
    double result = Calculator::evaluate(expression);

    ToolOutput out;
    out.text = "Result: " + format_number(result);
    out.structured = {{"expression", expression}, {"result", result}};
    return out;
}

inline void register_tools(Dispatcher& dispatcher) {
    dispatcher.register_tool({
        "calculate_compound_interest",
        "Calculate compound interest: A = P(1 + r/n)^(nt). Rate is an annual percentage.",
        ToolKind::Compute,
        {
            {"principal", ParamType::Number, true, "Initial amount"},
            {"rate", ParamType::Number, true, "Annual interest rate in percent, e.g. 5 for 5%"},
            {"time", ParamType::Number, true, "Time in years"},
            {"compounds_per_year", ParamType::Integer, false, "Compounding periods per year", 12}
        },
        calculate_compound_interest
    });

    dispatcher.register_tool({
        "analyze_investment_returns",
        "Analyze an investment: total return, CAGR and average annual return.",
        ToolKind::Compute,
        {
            {"initial", ParamType::Number, true, "Initial investment"},
            {"final", ParamType::Number, true, "Final value"},
            {"years", ParamType::Number, true, "Holding period in years"}
        },
        analyze_investment_returns
    });

    dispatcher.register_tool({
        "calculate",
        "Evaluate an arithmetic expression with + - * / % ** and parentheses.",
        ToolKind::Compute,
        {
            {"expression", ParamType::String, true, "Expression, e.g. (1500 * 0.045) / 12"}
        },
        calculate
    });
}

} // namespace kosha::tools::compute
