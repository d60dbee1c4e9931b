#include <cstdio>
#include <cstdlib>

#ifndef MYCONST_H
#define MYCONST_H

/* See MyConstants.cc for definitions and values for all of these switches.
   If you want to change a value you must re-compile for it to take effect */
class DEBUGFLAGS{
 public:

  /* Printer switches */
  bool DEBUGPARTITION;
  bool DEBUGLUMP;
  bool DEBUGTFA;
  bool DEBUGMILP;
  bool PRINTLUMPS;
  bool PRINTSOLUTION;

  /* Numerical precision */
  double FLUX_CUTOFF;
  double INTEGER_CUTOFF;
  double STOICH_CUTOFF;

  /* Formulation constants */
  double BIGM;
  double DG_BIGM;
  double DG_EPSILON;
  double RT;
  double MIN_CONC;
  double MAX_CONC;
  double KCAL_TO_KJ;
  double MAX_DG_ERR;

  /* Default flux bound used when a model does not give one */
  double DEFAULT_BOUND;
  /* Fraction of the maximum growth used when growth_rate is "auto" */
  double AUTO_GROWTH_FRACTION;

  /* Solver defaults (overridden by the parameter file) */
  double DEFAULT_TIMEOUT;
  double DEFAULT_FEASIBILITY;
  double DEFAULT_MIP_GAP;

  DEBUGFLAGS();
};

/* Global debugflags variable - should be used in all files in the project instead of each one defning its own copy  */
const DEBUGFLAGS _db;

#endif
