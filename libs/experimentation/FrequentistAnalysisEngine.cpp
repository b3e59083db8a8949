// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FrequentistAnalysisEngine.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "ExperimentExceptions.h"
#include "HypothesisTests.h"
#include "StatUtils.h"

namespace abtesting
{
  FrequentistAnalysisEngine::FrequentistAnalysisEngine(double confidenceLevel,
                                                       MultipleTestingCorrectionMethod correction,
                                                       double srmThreshold)
    : mConfidenceLevel(confidenceLevel),
      mCorrection(correction),
      mSrmThreshold(srmThreshold)
  {
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
      throw std::invalid_argument("FrequentistAnalysisEngine: confidence level must be in (0, 1)");
    if (!(srmThreshold > 0.0 && srmThreshold < 1.0))
      throw std::invalid_argument("FrequentistAnalysisEngine: SRM threshold must be in (0, 1)");
  }

  MetricTestResult FrequentistAnalysisEngine::testMetric(const std::string& metricName,
                                                         const std::vector<double>& control,
                                                         const std::vector<double>& treatment) const
  {
    if (control.empty() || treatment.empty())
      throw InsufficientDataException("Metric '" + metricName + "' has no observations in " +
                                      std::string(control.empty() ? "control" : "treatment"));

    MetricTestResult result;
    result.metricName = metricName;
    result.controlSampleSize = control.size();
    result.treatmentSampleSize = treatment.size();

    const bool binary = isBinarySample(control) && isBinarySample(treatment);

    if (binary)
      {
        const auto successes = [](const std::vector<double>& v) {
          return static_cast<std::size_t>(std::count(v.begin(), v.end(), 1.0));
        };

        const ChiSquare2x2Result chi = chiSquare2x2Test(successes(control), control.size(),
                                                        successes(treatment), treatment.size());
        result.test = FrequentistTest::ChiSquare;
        result.statistic = chi.statistic;
        result.pValue = chi.pValue;
        result.effectSize = chi.phi;
        result.effectSizeMeasure = EffectSizeMeasure::Phi;
        result.controlMean = chi.controlRate;
        result.treatmentMean = chi.treatmentRate;
        result.degreesOfFreedom = 1.0;
      }
    else
      {
        if (control.size() < 2 || treatment.size() < 2)
          throw InsufficientDataException("Metric '" + metricName +
                                          "' needs at least two observations per arm");

        if (isApproximatelyNormal(control) && isApproximatelyNormal(treatment))
          {
            const WelchTTestResult t = welchTTest(control, treatment);
            result.test = FrequentistTest::WelchTTest;
            result.statistic = t.statistic;
            result.pValue = t.pValue;
            result.effectSize = t.cohensD;
            result.effectSizeMeasure = EffectSizeMeasure::CohensD;
            result.controlMean = t.controlMean;
            result.treatmentMean = t.treatmentMean;
            result.degreesOfFreedom = t.degreesOfFreedom;
          }
        else
          {
            const MannWhitneyResult mw = mannWhitneyUTest(control, treatment);
            result.test = FrequentistTest::MannWhitneyU;
            result.statistic = mw.uStatistic;
            result.pValue = mw.pValue;
            result.effectSize = mw.rankBiserial;
            result.effectSizeMeasure = EffectSizeMeasure::RankBiserial;
            result.controlMean = StatUtils::computeMean(control);
            result.treatmentMean = StatUtils::computeMean(treatment);
            result.controlMedian = mw.controlMedian;
            result.treatmentMedian = mw.treatmentMedian;
          }
      }

    result.difference = result.treatmentMean - result.controlMean;
    if (result.controlMean != 0.0)
      result.relativeDifference = result.difference / result.controlMean;

    result.confidenceInterval = meanDifferenceInterval(control, treatment, mConfidenceLevel);
    result.significant = result.pValue < (1.0 - mConfidenceLevel);
    return result;
  }

  SampleRatioMismatchResult
  FrequentistAnalysisEngine::checkSampleRatioMismatch(const std::vector<Variant>& variants,
                                                      const std::map<std::string, std::size_t>& counts,
                                                      double threshold)
  {
    SampleRatioMismatchResult result;
    if (variants.size() < 2)
      return result;

    std::vector<double> observed;
    std::vector<double> weights;
    double total = 0.0;
    for (const auto& v : variants)
      {
        auto it = counts.find(v.getName());
        const double count = (it == counts.end()) ? 0.0 : static_cast<double>(it->second);
        observed.push_back(count);
        weights.push_back(v.getNormalizedWeight());
        total += count;
        result.observed[v.getName()] = count;
      }

    for (const auto& v : variants)
      result.expected[v.getName()] = total * v.getNormalizedWeight();

    const GoodnessOfFitResult fit = chiSquareGoodnessOfFit(observed, weights);
    result.statistic = fit.statistic;
    result.pValue = fit.pValue;
    result.degreesOfFreedom = fit.degreesOfFreedom;
    result.detected = total > 0.0 && fit.pValue < threshold;
    return result;
  }

  void FrequentistAnalysisEngine::applyCorrection(FrequentistResult& result) const
  {
    result.correction = MultipleTestingCorrectionMethod::None;
    if (result.secondary.empty())
      return;

    std::vector<double> raw;
    raw.push_back(result.primary.pValue);
    for (const auto& m : result.secondary)
      raw.push_back(m.pValue);

    const std::vector<double> adjusted = adjustPValues(raw, mCorrection);
    const double alpha = 1.0 - mConfidenceLevel;

    result.correction = mCorrection;
    result.primary.adjustedPValue = adjusted[0];
    result.primary.significant = adjusted[0] < alpha;
    for (std::size_t i = 0; i < result.secondary.size(); ++i)
      {
        result.secondary[i].adjustedPValue = adjusted[i + 1];
        result.secondary[i].significant = adjusted[i + 1] < alpha;
      }
  }

  FrequentistResult FrequentistAnalysisEngine::analyze(const AnalysisData& data,
                                                       const std::string& controlVariant,
                                                       const std::string& treatmentVariant) const
  {
    const VariantData& control = data.getVariant(controlVariant);
    const VariantData& treatment = data.getVariant(treatmentVariant);

    FrequentistResult result;
    result.controlVariant = controlVariant;
    result.treatmentVariant = treatmentVariant;
    result.confidenceLevel = mConfidenceLevel;

    const std::string& primary = data.getPrimaryMetric();
    result.primary = testMetric(primary, control.getValues(primary), treatment.getValues(primary));

    for (const auto& metric : data.getSecondaryMetrics())
      {
        try
          {
            result.secondary.push_back(testMetric(metric, control.getValues(metric),
                                                  treatment.getValues(metric)));
          }
        catch (const InsufficientDataException& e)
          {
            result.skippedMetrics.emplace_back(metric, e.what());
          }
      }

    applyCorrection(result);

    // Allocation check uses assignments when available, else users with metrics
    std::map<std::string, std::size_t> counts;
    std::size_t assignedTotal = 0;
    for (const auto& v : data.getVariants())
      assignedTotal += v.assignedUsers;

    for (const auto& v : data.getVariants())
      counts[v.name] = (assignedTotal > 0) ? v.assignedUsers : v.sampleSize;

    std::vector<Variant> variants;
    for (const auto& v : data.getVariants())
      variants.emplace_back(v.name, v.normalizedWeight, v.normalizedWeight);

    result.sampleRatioMismatch = checkSampleRatioMismatch(variants, counts, mSrmThreshold);
    return result;
  }
}
