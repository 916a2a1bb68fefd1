#pragma once

#include <treetags/language_profile.h>
#include <treetags/language_registry.h>
#include <treetags/logging.h>

#include <memory>
#include <vector>

namespace treetags {

// Compiles the grammar of one user registration. Registrations naming a
// built-in language may leave out the query and extensions to reuse the
// built-in ones. Throws ProfileLoadError.
LanguageProfile LoadUserProfile(const GrammarRegistration &registration);

// Registers every user grammar, then every built-in language whose grammar
// library loads and that no loaded user grammar replaces. A user grammar
// that fails leaves the built-in of the same name registered. Failures end
// up in registry.Errors().
void LoadProfiles(LanguageRegistry &registry,
                  const std::vector<GrammarRegistration> &grammars,
                  const std::shared_ptr<Logger> &logger = nullptr);

} // namespace treetags
