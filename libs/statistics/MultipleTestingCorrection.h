// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_MULTIPLE_TESTING_CORRECTION_H
#define __ABTESTING_MULTIPLE_TESTING_CORRECTION_H 1

#include <vector>
#include <string>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <cstddef>

namespace abtesting
{
  enum class MultipleTestingCorrectionMethod
    {
      None,
      Bonferroni,
      Holm
    };

  inline std::string toString(MultipleTestingCorrectionMethod method)
  {
    switch (method)
      {
      case MultipleTestingCorrectionMethod::None:
        return "none";
      case MultipleTestingCorrectionMethod::Bonferroni:
        return "bonferroni";
      case MultipleTestingCorrectionMethod::Holm:
        return "holm";
      }

    throw std::logic_error("toString: unhandled MultipleTestingCorrectionMethod");
  }

  /**
   * @brief Parses "none", "bonferroni" or "holm".
   * @throws std::invalid_argument for any other name
   */
  inline MultipleTestingCorrectionMethod parseMultipleTestingCorrectionMethod(const std::string& name)
  {
    if (name == "none")
      return MultipleTestingCorrectionMethod::None;
    if (name == "bonferroni")
      return MultipleTestingCorrectionMethod::Bonferroni;
    if (name == "holm")
      return MultipleTestingCorrectionMethod::Holm;

    throw std::invalid_argument("Unknown multiple testing correction method: " + name);
  }

  /**
   * @brief Bonferroni adjustment: min(p * m, 1) for each of the m raw p-values.
   */
  inline std::vector<double> bonferroniAdjust(const std::vector<double>& rawPValues)
  {
    const double m = static_cast<double>(rawPValues.size());
    std::vector<double> adjusted;
    adjusted.reserve(rawPValues.size());

    for (double p : rawPValues)
      adjusted.push_back(std::min(p * m, 1.0));

    return adjusted;
  }

  /**
   * @brief Holm step-down adjustment.
   *
   * The raw p-values are ranked ascending; the value at rank r (0-based) is
   * scaled by (m - r), capped at 1, and a running maximum keeps the adjusted
   * values monotone in rank order. Results are returned in input order.
   */
  inline std::vector<double> holmAdjust(const std::vector<double>& rawPValues)
  {
    const std::size_t m = rawPValues.size();
    std::vector<double> adjusted(m);
    if (m == 0)
      return adjusted;

    std::vector<std::size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&rawPValues](std::size_t a, std::size_t b) { return rawPValues[a] < rawPValues[b]; });

    double runningMax = 0.0;
    for (std::size_t rank = 0; rank < m; ++rank)
      {
        const std::size_t idx = order[rank];
        const double scaled = std::min(rawPValues[idx] * static_cast<double>(m - rank), 1.0);
        runningMax = std::max(runningMax, scaled);
        adjusted[idx] = runningMax;
      }

    return adjusted;
  }

  inline std::vector<double> adjustPValues(const std::vector<double>& rawPValues,
                                           MultipleTestingCorrectionMethod method)
  {
    switch (method)
      {
      case MultipleTestingCorrectionMethod::None:
        return rawPValues;
      case MultipleTestingCorrectionMethod::Bonferroni:
        return bonferroniAdjust(rawPValues);
      case MultipleTestingCorrectionMethod::Holm:
        return holmAdjust(rawPValues);
      }

    throw std::logic_error("adjustPValues: unhandled MultipleTestingCorrectionMethod");
  }
}

#endif
