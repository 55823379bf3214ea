#include "engine/analysis_engine.hpp"
#include "functions/clean_function.hpp"
#include "functions/correlate_function.hpp"
#include "functions/describe_function.hpp"
#include "functions/hypothesis_functions.hpp"
#include "functions/kmeans_function.hpp"
#include "functions/pca_function.hpp"
#include "functions/regress_function.hpp"
#include "statkit/cleaning/data_cleaner.hpp"
#include "statkit/core/errors.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

AnalysisResult AnalysisEngine::Run(const core::Dataset &dataset, const AnalysisRequest &request,
                                   const core::CancellationToken *cancellation) {
	const char *kind = AnalysisKindName(request.Kind());
	STATKIT_DEBUG("Running " << kind << " on " << dataset.RowCount() << " rows x " << dataset.ColumnCount()
	                         << " columns, " << request.Selection().Entries().size() << " selected, "
	                         << request.Options().size() << " options");
	for (const auto &option : request.Options()) {
		STATKIT_TRACE(kind << " option " << option.first << " = " << FormatOptionValue(option.second));
	}

	try {
		core::CheckCancelled(cancellation, kind);
		auto result = Dispatch(dataset, request, cancellation);
		STATKIT_DEBUG(kind << " completed with " << result.Charts().size() << " charts");
		return result;
	} catch (const core::StatkitError &e) {
		STATKIT_WARN(kind << " failed [" << core::ErrorKindName(e.Kind()) << "]: " << e.what());
		throw;
	} catch (const std::exception &e) {
		STATKIT_ERROR(kind << " failed unexpectedly: " << e.what());
		throw;
	}
}

AnalysisResult AnalysisEngine::Dispatch(const core::Dataset &dataset, const AnalysisRequest &request,
                                        const core::CancellationToken *cancellation) {
	switch (request.Kind()) {
	case AnalysisKind::CLEAN:
		return CleanFunction::Run(dataset, request);
	case AnalysisKind::DESCRIBE:
		return DescribeFunction::Run(dataset, request);
	case AnalysisKind::TTEST:
		return TTestFunction::Run(dataset, request);
	case AnalysisKind::ANOVA:
		return AnovaFunction::Run(dataset, request);
	case AnalysisKind::CORRELATE:
		return CorrelateFunction::Run(dataset, request, cancellation);
	case AnalysisKind::REGRESS:
		return RegressFunction::Run(dataset, request, cancellation);
	case AnalysisKind::PCA:
		return PcaFunction::Run(dataset, request, cancellation);
	case AnalysisKind::KMEANS:
		return KMeansFunction::Run(dataset, request, cancellation);
	default:
		throw core::InvalidConfigError("unsupported analysis kind");
	}
}

core::QualityReport AnalysisEngine::CheckQuality(const core::Dataset &dataset) {
	STATKIT_DEBUG("Quality check of " << dataset.RowCount() << " rows x " << dataset.ColumnCount() << " columns");
	auto report = cleaning::DataCleaner::CheckQuality(dataset);
	STATKIT_INFO("quality: " << report.missing_total << " missing cells, " << report.duplicate_rows.size()
	                         << " rows in duplicate groups, " << report.outliers_by_column.size()
	                         << " columns with outliers");
	return report;
}

} // namespace engine
} // namespace statkit
