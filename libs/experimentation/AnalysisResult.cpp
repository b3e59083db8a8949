// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "AnalysisResult.h"
#include <stdexcept>

namespace abtesting
{
  std::string toString(FrequentistTest test)
  {
    switch (test)
      {
      case FrequentistTest::ChiSquare:
        return "chi_square";
      case FrequentistTest::WelchTTest:
        return "welch_t_test";
      case FrequentistTest::MannWhitneyU:
        return "mann_whitney_u";
      }

    throw std::logic_error("toString: unhandled FrequentistTest");
  }

  std::string toString(EffectSizeMeasure measure)
  {
    switch (measure)
      {
      case EffectSizeMeasure::Phi:
        return "phi";
      case EffectSizeMeasure::CohensD:
        return "cohens_d";
      case EffectSizeMeasure::RankBiserial:
        return "rank_biserial";
      }

    throw std::logic_error("toString: unhandled EffectSizeMeasure");
  }

  std::string toString(AnalysisStatus status)
  {
    switch (status)
      {
      case AnalysisStatus::Complete:
        return "complete";
      case AnalysisStatus::InsufficientData:
        return "insufficient_data";
      }

    throw std::logic_error("toString: unhandled AnalysisStatus");
  }

  std::optional<std::string> BayesianMetricResult::recommendWinner(double threshold) const
  {
    for (const auto& [variant, probability] : probabilityOfBeingBest)
      if (probability >= threshold)
        return variant;

    return std::nullopt;
  }
}
