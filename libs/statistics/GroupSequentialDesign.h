// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_GROUP_SEQUENTIAL_DESIGN_H
#define __ABTESTING_GROUP_SEQUENTIAL_DESIGN_H 1

#include <vector>
#include <cstddef>

namespace abtesting
{
  /**
   * @class GroupSequentialDesign
   * @brief Two-sided O'Brien-Fleming design with K equally spaced looks.
   *
   * Stage k (1-based) sits at information fraction t_k = k / K and rejects when
   * |Z_k| >= C * sqrt(K / k). The constant C is solved so that the probability
   * under H0 of crossing at any look equals alpha.
   *
   * Crossing probabilities are computed with the Armitage-McPherson-Rowe
   * recursion: on the Brownian-motion scale W_k = Z_k * sqrt(t_k) the boundary
   * is the constant C, and the sub-density of W_k on the continuation region
   * is propagated stage to stage by numerical (Simpson) convolution with the
   * normal increment density. With the grid used here the total crossing
   * probability is accurate to about 1e-7.
   */
  class GroupSequentialDesign
  {
  public:
    /**
     * @throws std::invalid_argument if numStages < 1 or alpha is not in (0, 1)
     */
    GroupSequentialDesign(std::size_t numStages, double alpha);

    std::size_t getNumStages() const
    {
      return mNumStages;
    }

    double getAlpha() const
    {
      return mAlpha;
    }

    /// The solved O'Brien-Fleming constant C.
    double getBoundaryConstant() const
    {
      return mBoundaryConstant;
    }

    double getInformationFraction(std::size_t stage) const;

    /// |Z| boundary at the given 1-based stage.
    double getCriticalValue(std::size_t stage) const;

    /// Two-sided nominal significance level 2 * (1 - Phi(b_k)) of the stage boundary.
    double getNominalAlpha(std::size_t stage) const;

    /// Probability under H0 of stopping at or before the given stage.
    double getCumulativeAlphaSpent(std::size_t stage) const;

    /**
     * @brief Stage-wise ordering p-value for a trial that stopped at the given
     *        stage with observed statistic z: the probability under H0 of
     *        stopping earlier, plus stopping at this stage with |Z| >= |z|.
     */
    double stagewisePValue(std::size_t stage, double z) const;

  private:
    void validateStage(std::size_t stage) const;

    /**
     * @brief Per-stage crossing probabilities under H0 for boundaries given on
     *        the Brownian-motion scale (|W_k| >= bounds[k]).
     */
    std::vector<double> crossingProbabilities(const std::vector<double>& brownianBounds) const;

    std::vector<double> brownianBounds(double constant) const;

  private:
    std::size_t mNumStages;
    double mAlpha;
    double mBoundaryConstant;
    std::vector<double> mCumulativeAlpha;
  };
}

#endif
