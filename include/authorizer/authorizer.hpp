#pragma once

// Main public API - include all headers
#include "authorizer/constants.hpp"
#include "authorizer/errors.hpp"
#include "authorizer/claims.hpp"
#include "authorizer/token.hpp"
#include "authorizer/key_set.hpp"
#include "authorizer/key_fetcher.hpp"
#include "authorizer/key_cache.hpp"
#include "authorizer/validation.hpp"
#include "authorizer/policy.hpp"
#include "authorizer/principal.hpp"
#include "authorizer/config.hpp"
#include "authorizer/decision.hpp"
#include "authorizer/handler.hpp"

namespace authorizer {}
