#pragma once

#include "pathforge/binding.hpp"  // IWYU pragma: export
#include "pathforge/controller.hpp"  // IWYU pragma: export
#include "pathforge/delegation.hpp"  // IWYU pragma: export
#include "pathforge/dispatch-result.hpp"  // IWYU pragma: export
#include "pathforge/element.hpp"  // IWYU pragma: export
#include "pathforge/function.hpp"  // IWYU pragma: export
#include "pathforge/inject.hpp"  // IWYU pragma: export
#include "pathforge/injection-error.hpp"  // IWYU pragma: export
#include "pathforge/injector.hpp"  // IWYU pragma: export
#include "pathforge/method.hpp"  // IWYU pragma: export
#include "pathforge/path-info.hpp"  // IWYU pragma: export
#include "pathforge/path.hpp"  // IWYU pragma: export
#include "pathforge/root.hpp"  // IWYU pragma: export
#include "pathforge/route-definition-error.hpp"  // IWYU pragma: export
#include "pathforge/route-table.hpp"  // IWYU pragma: export
#include "pathforge/router-config.hpp"  // IWYU pragma: export
#include "pathforge/url-for.hpp"  // IWYU pragma: export
#include "pathforge/value.hpp"  // IWYU pragma: export
#include "pathforge/want-signature.hpp"  // IWYU pragma: export
