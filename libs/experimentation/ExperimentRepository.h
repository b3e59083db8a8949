// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_REPOSITORY_H
#define __ABTESTING_EXPERIMENT_REPOSITORY_H 1

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include "Experiment.h"

namespace abtesting
{
  /**
   * @class ExperimentRepository
   * @brief Owns every experiment definition created by the framework.
   *
   * Experiments are never removed. Readers receive copies; the single
   * Active -> Stopped transition happens under the exclusive lock so that
   * concurrent stop requests converge on one winner.
   */
  class ExperimentRepository
  {
  public:
    ExperimentRepository() = default;
    ExperimentRepository(const ExperimentRepository&) = delete;
    ExperimentRepository& operator=(const ExperimentRepository&) = delete;

    /// "exp_" followed by a random UUID.
    std::string generateId();

    /**
     * @return false if an experiment with the same id already exists
     */
    bool insert(const Experiment& experiment);

    std::optional<Experiment> find(const std::string& experimentId) const;

    std::vector<Experiment> getAll() const;

    std::vector<Experiment> getActive() const;

    /**
     * @brief Moves the experiment to Stopped and returns the stopped snapshot.
     *
     * @throws ExperimentNotFoundException if the id is unknown
     * @throws InvalidExperimentStateException if the experiment is already stopped
     */
    Experiment stop(const std::string& experimentId,
                    const std::string& reason,
                    boost::posix_time::ptime endedAt);

    std::size_t size() const;

    std::size_t countWithStatus(ExperimentStatus status) const;

  private:
    mutable std::shared_mutex mMutex;
    std::map<std::string, Experiment> mExperiments;
    std::mutex mIdMutex;
    boost::uuids::random_generator mUuidGenerator;
  };
}

#endif
