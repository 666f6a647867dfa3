#pragma once
/*
===============================================================================
ERRORS — Exception types raised by the planning core
===============================================================================

OVERVIEW
--------
The planning core distinguishes three exceptional conditions. Ordinary solve
outcomes (infeasible model, solver failure) are never exceptions; they travel
as SolutionStatus / PlanStatus values.

    ConfigError          Malformed catalog, schedule or request file.
                         Recoverable by the caller by fixing the input.
    DecodeError          Solution does not match the Model's variable layout.
                         An internal bug, never a user-facing condition.
    InvariantViolation   A solve outcome the model makes impossible
                         (e.g. an unbounded objective with non-negative costs).

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace capplan {

    /**
     * @brief Input validation failure
     *
     * @details Carries every problem found, not only the first, so one
     *          round-trip is enough to fix a request file.
     */
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& what)
            : std::invalid_argument(what), problems_{what}
        {
        }

        explicit ConfigError(std::vector<std::string> problems)
            : std::invalid_argument(join(problems)), problems_(std::move(problems))
        {
        }

        const std::vector<std::string>& problems() const noexcept { return problems_; }

    private:
        static std::string join(const std::vector<std::string>& problems) {
            std::string out = "invalid planning input:";
            for (const auto& p : problems) {
                out.append("\n  - ").append(p);
            }
            return out;
        }

        std::vector<std::string> problems_;
    };

    /// @brief Builder/decoder naming-scheme mismatch
    class DecodeError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /// @brief Solver outcome that the model formulation rules out
    class InvariantViolation : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace capplan
