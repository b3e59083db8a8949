// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_EVENT_SUBJECT_H
#define __ABTESTING_EXPERIMENT_EVENT_SUBJECT_H 1

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include "ExperimentEventObserver.h"

namespace abtesting
{
  /**
   * @class ExperimentEventSubject
   * @brief Observer registry with shared-lock notification.
   */
  class ExperimentEventSubject
  {
  protected:
    mutable std::shared_mutex m_observersMutex;
    std::vector<ExperimentEventObserver*> m_observers;

  public:
    virtual ~ExperimentEventSubject() = default;

    /**
     * @param observer Must outlive its registration
     */
    virtual void attach(ExperimentEventObserver* observer)
    {
      std::unique_lock<std::shared_mutex> lock(m_observersMutex);
      m_observers.push_back(observer);
    }

    virtual void detach(ExperimentEventObserver* observer)
    {
      std::unique_lock<std::shared_mutex> lock(m_observersMutex);
      m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), observer),
                        m_observers.end());
    }

  protected:
    virtual void notifyObservers(const ExperimentEvent& event)
    {
      std::shared_lock<std::shared_mutex> lock(m_observersMutex);
      for (auto* observer : m_observers)
        {
          if (observer)
            observer->update(event);
        }
    }
  };
}

#endif
