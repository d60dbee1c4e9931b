#ifndef _XML_LOADER
#define _XML_LOADER

/* C++ library */
#include "DataStructures.h"

using std::vector;
using std::map;

/* All of these return LOAD_SUCCESS or LOAD_FAILED (and print an ERROR saying why) */

/* SBML level 2 / 3 model. Flux bounds come from the fbc package when it is there and from
   LOWER_BOUND / UPPER_BOUND kinetic law parameters otherwise */
int parseSBML(const char* docname, MODEL &model);
/* <thermodb name="..." units="kJ/mol|kcal/mol"> with one <compound> per entry; stored in kJ/mol */
int parseThermoDB(const char* docname, THERMODB &thermoDb);
/* <lumpgem> run parameters */
int parseParams(const char* docname, LUMPPARAMS &params);

#endif
