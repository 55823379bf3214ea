#pragma once

#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/regression_options.hpp"
#include "statkit/core/regression_result.hpp"
#include "statkit/diagnostics/regression_diagnostics.hpp"
#include "statkit/diagnostics/vif.hpp"
#include "statkit/inference/coefficient_inference.hpp"
#include "statkit/solvers/ols_solver.hpp"
#include <string>
#include <vector>

namespace statkit {
namespace solvers {

/**
 * Simple and multiple linear regression over dataset columns
 *
 * Rows with a missing value in the dependent column or any independent column
 * are excluded (listwise). The fit runs through OLSSolver, then coefficient
 * inference, observation diagnostics and (for 2+ predictors with an
 * intercept) variance inflation factors are added.
 */
class LinearRegression {
public:
	/**
	 * @param cancellation Optional token, polled between the fit phases
	 * @throws InvalidConfigError with no independents, the dependent among the independents,
	 *         or a non-numeric column
	 * @throws SingularDesignError for rank-deficient designs (constant or collinear predictors,
	 *         too few complete rows)
	 * @throws DegenerateInputError when the dependent is constant
	 */
	static core::RegressionResult Regress(const core::Dataset &dataset, const std::string &dependent,
	                                      const std::vector<std::string> &independents,
	                                      const core::RegressionOptions &options = core::RegressionOptions::OLS(),
	                                      const core::CancellationToken *cancellation = nullptr) {
		options.Validate();
		if (independents.empty()) {
			throw core::InvalidConfigError("regression requires at least one independent column");
		}
		for (const auto &name : independents) {
			if (name == dependent) {
				throw core::InvalidConfigError("column '" + name + "' is both dependent and independent");
			}
		}

		std::vector<std::string> names;
		names.push_back(dependent);
		names.insert(names.end(), independents.begin(), independents.end());

		std::vector<size_t> rows;
		const Eigen::MatrixXd data = dataset.CompleteCases(names, &rows);
		const Eigen::VectorXd y = data.col(0);
		const Eigen::MatrixXd X = data.rightCols(static_cast<Eigen::Index>(independents.size()));

		// Name the offending predictor rather than report a bare rank
		if (options.intercept) {
			const auto constant = OLSSolver::DetectConstantColumns(X);
			for (size_t j = 0; j < constant.size(); j++) {
				if (constant[j]) {
					throw core::SingularDesignError("predictor '" + independents[j] +
					                                "' is constant and collinear with the intercept");
				}
			}
		}

		core::CheckCancelled(cancellation, "regression fit");
		auto result = OLSSolver::FitWithStdErrors(y, X, options);

		core::CheckCancelled(cancellation, "regression inference");
		const auto inference = inference::CoefficientInference::ComputeInference(result, options.confidence_level);
		inference::CoefficientInference::Apply(inference, result);

		core::CheckCancelled(cancellation, "regression diagnostics");
		diagnostics::RegressionDiagnostics::ComputeAllDiagnostics(X, result);
		if (options.intercept && independents.size() >= 2) {
			for (const auto &vif : diagnostics::VIFCalculator::ComputeVIF(X)) {
				result.vif.push_back(vif.vif);
			}
		}

		result.dependent_name = dependent;
		if (options.intercept) {
			result.coefficient_names.push_back("(Intercept)");
		}
		result.coefficient_names.insert(result.coefficient_names.end(), independents.begin(), independents.end());
		result.source_rows = std::move(rows);
		return result;
	}
};

} // namespace solvers
} // namespace statkit
