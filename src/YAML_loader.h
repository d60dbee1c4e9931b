#ifndef _YAML_LOADER
#define _YAML_LOADER

#include "DataStructures.h"

/* COBRA dictionary models (cobrapy save_yaml_model / save_json_model). JSON is read as YAML.
   Returns LOAD_SUCCESS or LOAD_FAILED */
int parseCobraDict(const char* filename, MODEL &model);

#endif
