#ifndef INPUTSETUP_H
#define INPUTSETUP_H

#include "DataStructures.h"

/* Pick the model reader from the file extension (.xml SBML, .yml/.yaml/.json COBRA dictionary).
   .mat and anything else give LOAD_UNSUPPORTED */
int loadModel(const char* filename, MODEL &model);

/* Set the lower bound of every reaction named in medium. Returns LOAD_FAILED if one is missing */
int applyMedium(MODEL &model, const map<string, double> &medium);

/* Command line, parameter file, model, medium and thermodynamic database in that order.
   Returns LOAD_SUCCESS or the first failure */
int InputSetup(int argc, char *argv[], LUMPPARAMS &params, MODEL &model, THERMODB &thermoDb);

#endif
