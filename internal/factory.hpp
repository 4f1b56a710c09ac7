#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/manual_adjustment_service.hpp"
#include "internal/service/tournament_service.hpp"

namespace tables::factory {

/*
  Application

  Owns all long-lived objects used by the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::GenerationService>       generation_service;
  std::shared_ptr<service::ManualAdjustmentService> adjustment_service;
  std::shared_ptr<service::TournamentService>       tournament_service;
};

/*
  Build

  Constructs the application from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const tables::runtime::config::RuntimeConfig& config);

} // namespace tables::factory
