// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "GroupSequentialDesign.h"
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include "NormalQuantile.h"

namespace abtesting
{
  namespace
  {
    constexpr std::size_t kGridPoints = 301;   // odd, for Simpson's rule
    constexpr int kBisectionIterations = 60;
    constexpr double kBisectionTolerance = 1.0e-9;

    std::vector<double> simpsonWeights(std::size_t points, double step)
    {
      std::vector<double> weights(points, 0.0);
      for (std::size_t i = 0; i < points; ++i)
        {
          if (i == 0 || i == points - 1)
            weights[i] = 1.0;
          else
            weights[i] = (i % 2 == 1) ? 4.0 : 2.0;
          weights[i] *= step / 3.0;
        }
      return weights;
    }
  }

  GroupSequentialDesign::GroupSequentialDesign(std::size_t numStages, double alpha)
    : mNumStages(numStages),
      mAlpha(alpha),
      mBoundaryConstant(0.0),
      mCumulativeAlpha()
  {
    if (numStages < 1)
      throw std::invalid_argument("GroupSequentialDesign: at least one stage is required");
    if (!(alpha > 0.0 && alpha < 1.0))
      throw std::invalid_argument("GroupSequentialDesign: alpha must be in (0, 1)");

    // Total crossing probability is decreasing in C, and C is at least the
    // fixed-sample critical value.
    double lo = detail::compute_normal_quantile(1.0 - alpha / 2.0);
    double hi = lo + 3.0;

    for (int iter = 0; iter < kBisectionIterations && (hi - lo) > kBisectionTolerance; ++iter)
      {
        const double mid = 0.5 * (lo + hi);
        const std::vector<double> exits = crossingProbabilities(brownianBounds(mid));
        const double total = std::accumulate(exits.begin(), exits.end(), 0.0);

        if (total > alpha)
          lo = mid;
        else
          hi = mid;
      }

    mBoundaryConstant = 0.5 * (lo + hi);

    const std::vector<double> exits = crossingProbabilities(brownianBounds(mBoundaryConstant));
    mCumulativeAlpha.resize(mNumStages);
    std::partial_sum(exits.begin(), exits.end(), mCumulativeAlpha.begin());
  }

  void GroupSequentialDesign::validateStage(std::size_t stage) const
  {
    if (stage < 1 || stage > mNumStages)
      throw std::out_of_range("GroupSequentialDesign: stage " + std::to_string(stage) +
                              " outside 1.." + std::to_string(mNumStages));
  }

  double GroupSequentialDesign::getInformationFraction(std::size_t stage) const
  {
    validateStage(stage);
    return static_cast<double>(stage) / static_cast<double>(mNumStages);
  }

  double GroupSequentialDesign::getCriticalValue(std::size_t stage) const
  {
    return mBoundaryConstant / std::sqrt(getInformationFraction(stage));
  }

  double GroupSequentialDesign::getNominalAlpha(std::size_t stage) const
  {
    return detail::compute_two_sided_normal_pvalue(getCriticalValue(stage));
  }

  double GroupSequentialDesign::getCumulativeAlphaSpent(std::size_t stage) const
  {
    validateStage(stage);
    return mCumulativeAlpha[stage - 1];
  }

  double GroupSequentialDesign::stagewisePValue(std::size_t stage, double z) const
  {
    validateStage(stage);

    std::vector<double> bounds = brownianBounds(mBoundaryConstant);
    bounds.resize(stage);
    bounds[stage - 1] = std::fabs(z) * std::sqrt(getInformationFraction(stage));

    const std::vector<double> exits = crossingProbabilities(bounds);
    const double p = std::accumulate(exits.begin(), exits.end(), 0.0);
    return std::fmin(1.0, p);
  }

  std::vector<double> GroupSequentialDesign::brownianBounds(double constant) const
  {
    // Z_k >= C / sqrt(t_k) is W_k >= C on the Brownian scale
    return std::vector<double>(mNumStages, constant);
  }

  std::vector<double>
  GroupSequentialDesign::crossingProbabilities(const std::vector<double>& bounds) const
  {
    const std::size_t stages = bounds.size();
    std::vector<double> exits(stages, 0.0);
    if (stages == 0)
      return exits;

    const double t1 = 1.0 / static_cast<double>(mNumStages);
    const double sd1 = std::sqrt(t1);

    exits[0] = 2.0 * detail::compute_normal_survival(bounds[0] / sd1);

    // Sub-density of W_1 on (-b_1, b_1)
    double step = 2.0 * bounds[0] / static_cast<double>(kGridPoints - 1);
    std::vector<double> grid(kGridPoints);
    std::vector<double> density(kGridPoints);
    for (std::size_t i = 0; i < kGridPoints; ++i)
      {
        grid[i] = -bounds[0] + step * static_cast<double>(i);
        density[i] = detail::compute_normal_pdf(grid[i] / sd1) / sd1;
      }

    const double increment = 1.0 / static_cast<double>(mNumStages);
    const double sdInc = std::sqrt(increment);

    for (std::size_t k = 1; k < stages; ++k)
      {
        const std::vector<double> weights = simpsonWeights(kGridPoints, step);
        const double b = bounds[k];

        double exit = 0.0;
        for (std::size_t i = 0; i < kGridPoints; ++i)
          {
            const double u = grid[i];
            const double pCross = detail::compute_normal_cdf((-b - u) / sdInc) +
              detail::compute_normal_survival((b - u) / sdInc);
            exit += weights[i] * density[i] * pCross;
          }
        exits[k] = exit;

        if (k + 1 == stages)
          break;

        const double nextStep = 2.0 * b / static_cast<double>(kGridPoints - 1);
        std::vector<double> nextGrid(kGridPoints);
        std::vector<double> nextDensity(kGridPoints, 0.0);
        for (std::size_t j = 0; j < kGridPoints; ++j)
          {
            nextGrid[j] = -b + nextStep * static_cast<double>(j);
            double value = 0.0;
            for (std::size_t i = 0; i < kGridPoints; ++i)
              value += weights[i] * density[i] *
                detail::compute_normal_pdf((nextGrid[j] - grid[i]) / sdInc);
            nextDensity[j] = value / sdInc;
          }

        grid.swap(nextGrid);
        density.swap(nextDensity);
        step = nextStep;
      }

    return exits;
  }
}
