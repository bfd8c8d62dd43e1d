#pragma once

/**
 * @file kiln.hpp
 * @brief kiln - resolve, render and install component bundles
 *
 * Pipeline: load_manifest() validates manifests served by a RegistryClient,
 * DependencyResolver turns requested roots into an InstallPlan, and
 * Installer renders and writes each component atomically, recording it in
 * the target's ledger.
 *
 * ```cpp
 * #include <kiln/kiln.hpp>
 *
 * kiln::DirectoryRegistry registry("/srv/registry");
 * kiln::DependencyResolver resolver(registry);
 * auto plan = resolver.resolve({{"web_search", "^1.0.0"}});
 * if (plan.isOk()) {
 *     kiln::Installer installer(registry);
 *     auto report = installer.install(plan.value(), "./project", {}, {});
 * }
 * ```
 */

#define KILN_VERSION "0.1.0"

#include "kiln/digest.hpp"
#include "kiln/error.hpp"
#include "kiln/installer.hpp"
#include "kiln/ledger.hpp"
#include "kiln/manifest.hpp"
#include "kiln/platform.hpp"
#include "kiln/project_config.hpp"
#include "kiln/registry.hpp"
#include "kiln/resolver.hpp"
#include "kiln/semver.hpp"
#include "kiln/template.hpp"
#include "kiln/types.hpp"
#include "kiln/warnings.hpp"
#include "kiln/worker_pool.hpp"
