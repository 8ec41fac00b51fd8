#ifndef __config_loader_hpp__
#define __config_loader_hpp__

/*
 * Copyright (C) 2013 by Carnegie Mellon University.
 */

#include <istream>
#include <string>

#include "mselect.hpp"

/* Parses an INI style configuration into *config_ptr.
 * Keys not present keep the values already in *config_ptr.
 * Throws ConfigError on unknown keys, bad values or failed validation. */
void load_config(std::istream& config_in, MselectConfig *config_ptr);
void load_config_file(const std::string& path, MselectConfig *config_ptr);

/* Throws ConfigError describing the first illegal value */
void validate_config(const MselectConfig& config);

#endif  // defined __config_loader_hpp__
