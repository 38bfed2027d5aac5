/**
 * @file text.hpp
 * @brief Scalar text that is either a view into the caller's input or an owned copy.
 */

#ifndef YAML_CHURN_TEXT_HPP
#define YAML_CHURN_TEXT_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace Churn {

/**
 * @class Text
 * @brief Borrow-or-own string used for scalar values.
 *
 * When a scalar appears verbatim in a caller-owned buffer the scanner hands out a
 * borrowed view, which stays valid only as long as that buffer does. Scalars that
 * needed unescaping or line folding are always owned. `MakeOwned()` detaches a
 * borrowed value from the input.
 */
class Text {
public:
    Text() = default;

    /** @brief An owned value. */
    Text(std::string s) : owned_(std::move(s)), borrowed_(false) {}

    Text(const char* s) : owned_(s), borrowed_(false) {}

    /** @brief A view into storage the caller keeps alive. */
    static Text Borrow(std::string_view v) {
        Text t;
        t.view_ = v;
        t.borrowed_ = true;
        return t;
    }

    std::string_view View() const noexcept { return borrowed_ ? view_ : std::string_view(owned_); }

    bool IsBorrowed() const noexcept { return borrowed_; }

    bool Empty() const noexcept { return View().empty(); }

    std::size_t Size() const noexcept { return View().size(); }

    std::string Str() const { return std::string(View()); }

    /** @brief Copy borrowed text into owned storage; no-op if already owned. */
    void MakeOwned() {
        if (!borrowed_)
            return;
        owned_.assign(view_.data(), view_.size());
        view_ = {};
        borrowed_ = false;
    }

    friend bool operator==(const Text& a, const Text& b) noexcept { return a.View() == b.View(); }
    friend bool operator==(const Text& a, std::string_view b) noexcept { return a.View() == b; }
    friend bool operator==(const Text& a, const char* b) noexcept { return a.View() == std::string_view(b); }
    friend bool operator==(const Text& a, const std::string& b) noexcept { return a.View() == std::string_view(b); }

    friend std::ostream& operator<<(std::ostream& os, const Text& t) { return os << t.View(); }

private:
    std::string owned_;
    std::string_view view_;
    bool borrowed_ = false;
};

} // namespace Churn

#endif // YAML_CHURN_TEXT_HPP
