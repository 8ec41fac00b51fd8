#ifndef __internal_config_hpp__
#define __internal_config_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#define FLOOR_SLACK             1e-9
#define BUDGET_SLACK            1e-9

#define POLICY_SH               "sh"
#define POLICY_SR               "sr"
#define POLICY_UNIFORM          "uniform"

#define EVALUATOR_SIMULATED     "simulated"
#define EVALUATOR_LIVE          "live"

#define SAMPLER_RANDOM          "random"
#define SAMPLER_GRID            "grid"

#define POOL_FROM_EVALUATOR     "evaluator"
#define POOL_FROM_FILE          "file"
#define POOL_FROM_MLP_SPACE     "mlp_space"

#define ERROR_KIND_CONFIG       "ConfigurationError"
#define ERROR_KIND_BAD_REQUEST  "BadRequest"
#define ERROR_KIND_INTERNAL     "InternalError"

#endif  // defined __internal_config_hpp__
