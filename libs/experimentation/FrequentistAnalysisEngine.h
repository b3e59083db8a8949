// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_FREQUENTIST_ANALYSIS_ENGINE_H
#define __ABTESTING_FREQUENTIST_ANALYSIS_ENGINE_H 1

#include <map>
#include <string>
#include <vector>
#include "AnalysisData.h"
#include "AnalysisResult.h"
#include "MultipleTestingCorrection.h"

namespace abtesting
{
  /**
   * @class FrequentistAnalysisEngine
   * @brief Control-versus-treatment hypothesis tests for every declared metric.
   *
   * Test selection per metric:
   *  - all observations 0/1: chi-square 2x2, effect size phi
   *  - both arms pass the normality heuristic (>= 30 values, moderate skew
   *    and kurtosis): Welch's t-test, effect size Cohen's d
   *  - otherwise: Mann-Whitney U, effect size rank-biserial correlation
   *
   * Every metric also gets a normal-approximation interval on the
   * difference in means (rates), and the run includes a sample-ratio-mismatch
   * check of the observed allocation against the configured weights.
   */
  class FrequentistAnalysisEngine
  {
  public:
    FrequentistAnalysisEngine(double confidenceLevel,
                              MultipleTestingCorrectionMethod correction,
                              double srmThreshold);

    /**
     * @throws AnalysisException if either variant name is missing from the experiment
     * @throws InsufficientDataException if the primary metric lacks data in either arm
     */
    FrequentistResult analyze(const AnalysisData& data,
                              const std::string& controlVariant,
                              const std::string& treatmentVariant) const;

    /**
     * @throws InsufficientDataException if an arm is too small for the selected test
     */
    MetricTestResult testMetric(const std::string& metricName,
                                const std::vector<double>& control,
                                const std::vector<double>& treatment) const;

    /**
     * @brief Chi-square goodness-of-fit of per-variant counts against normalized weights.
     *
     * @param counts variant -> observed users; variants missing from the map count as 0
     */
    static SampleRatioMismatchResult checkSampleRatioMismatch(const std::vector<Variant>& variants,
                                                              const std::map<std::string, std::size_t>& counts,
                                                              double threshold);

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

    MultipleTestingCorrectionMethod getCorrectionMethod() const
    {
      return mCorrection;
    }

  private:
    void applyCorrection(FrequentistResult& result) const;

  private:
    double mConfidenceLevel;
    MultipleTestingCorrectionMethod mCorrection;
    double mSrmThreshold;
  };
}

#endif
