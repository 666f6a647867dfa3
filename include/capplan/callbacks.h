#pragma once
/*
===============================================================================
CALLBACKS — Gurobi callback that watches a CancellationToken
===============================================================================

Overview
--------
GurobiSolver installs a SolveCallback on every GRBModel it optimizes. At each
callback point Gurobi offers (presolve, simplex, MIP, MIP node, ...), the
callback polls the CancellationToken and calls abort() once it is tripped.
Gurobi then stops with status GRB_INTERRUPTED, which GurobiSolver reports as
SolutionStatus::Error.

During branch-and-bound the callback also samples progress metrics, so the
solver can report how far it got when a run is interrupted.

Thread Safety
-------------
• Gurobi invokes callbacks from its own threads; the token is atomic
• lastProgress() must only be read after optimize() returned

Exception Safety
----------------
• Standard exceptions thrown inside callback() are converted to
  GRBException(GRB_ERROR_CALLBACK), which aborts the optimization

===============================================================================
*/

#include <cmath>
#include <exception>
#include <utility>

#include "gurobi_c++.h"
#include "solver.h"

namespace capplan {

/**
 * @brief Branch-and-bound progress sampled from callback attributes
 */
struct Progress {
    double runtime = 0.0;             ///< Elapsed time in seconds
    double bestObj = GRB_INFINITY;    ///< Best incumbent objective
    double bestBound = -GRB_INFINITY; ///< Best relaxation bound
    double gap = GRB_INFINITY;        ///< Relative gap (0.0 = optimal)
    int nodeCount = 0;
    int solutionCount = 0;

    bool hasSolution() const noexcept { return solutionCount > 0; }

    bool gapWithin(double tolerance) const noexcept { return gap <= tolerance; }
};

class SolveCallback : public GRBCallback {
public:
    explicit SolveCallback(CancellationToken token) : token_(std::move(token)) {}

    /// @brief True if this callback aborted the run
    bool aborted() const noexcept { return aborted_; }

    /// @brief Last MIP progress sample (defaults if none was taken)
    const Progress& lastProgress() const noexcept { return progress_; }

protected:
    void callback() override {
        try {
            if (where == GRB_CB_MIP) {
                progress_ = sampleProgress();
            }
            if (!aborted_ && token_.cancelled()) {
                aborted_ = true;
                abort();
            }
        } catch (GRBException&) {
            throw;
        } catch (std::exception& e) {
            throw GRBException(e.what(), GRB_ERROR_CALLBACK);
        }
    }

private:
    Progress sampleProgress() {
        Progress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
        p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
        p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIP_NODCNT));
        p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);

        if (p.solutionCount > 0 && std::abs(p.bestObj) > 1e-10) {
            p.gap = std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
        } else if (p.solutionCount > 0) {
            p.gap = std::abs(p.bestObj - p.bestBound);
        }
        return p;
    }

    CancellationToken token_;
    bool aborted_ = false;
    Progress progress_;
};

} // namespace capplan
