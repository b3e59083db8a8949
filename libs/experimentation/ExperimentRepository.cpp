// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentRepository.h"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "ExperimentExceptions.h"

namespace abtesting
{
  std::string ExperimentRepository::generateId()
  {
    std::lock_guard<std::mutex> lock(mIdMutex);
    return "exp_" + boost::uuids::to_string(mUuidGenerator());
  }

  bool ExperimentRepository::insert(const Experiment& experiment)
  {
    std::unique_lock<std::shared_mutex> lock(mMutex);
    return mExperiments.emplace(experiment.getId(), experiment).second;
  }

  std::optional<Experiment> ExperimentRepository::find(const std::string& experimentId) const
  {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    auto it = mExperiments.find(experimentId);
    if (it == mExperiments.end())
      return std::nullopt;

    return it->second;
  }

  std::vector<Experiment> ExperimentRepository::getAll() const
  {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    std::vector<Experiment> result;
    result.reserve(mExperiments.size());
    for (const auto& entry : mExperiments)
      result.push_back(entry.second);

    return result;
  }

  std::vector<Experiment> ExperimentRepository::getActive() const
  {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    std::vector<Experiment> result;
    for (const auto& entry : mExperiments)
      if (entry.second.isActive())
        result.push_back(entry.second);

    return result;
  }

  Experiment ExperimentRepository::stop(const std::string& experimentId,
                                        const std::string& reason,
                                        boost::posix_time::ptime endedAt)
  {
    std::unique_lock<std::shared_mutex> lock(mMutex);
    auto it = mExperiments.find(experimentId);
    if (it == mExperiments.end())
      throw ExperimentNotFoundException("Experiment " + experimentId + " not found");

    if (!it->second.markStopped(reason, endedAt))
      throw InvalidExperimentStateException("Experiment " + experimentId + " is not active");

    return it->second;
  }

  std::size_t ExperimentRepository::size() const
  {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    return mExperiments.size();
  }

  std::size_t ExperimentRepository::countWithStatus(ExperimentStatus status) const
  {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    std::size_t count = 0;
    for (const auto& entry : mExperiments)
      if (entry.second.getStatus() == status)
        ++count;

    return count;
  }
}
