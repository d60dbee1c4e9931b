#include <cstring>
#include <cstdio>
#include <cstdlib>
#include "MyConstants.h"

DEBUGFLAGS::DEBUGFLAGS() {

  /************ Printer switches **********************/
  /* True to print the core / non-core / biomass split of every reaction */
  DEBUGPARTITION = false;
  /* True to print every flux that contributes to a lumped reaction */
  DEBUGLUMP = false;
  /* True to print thermodynamic data computed in prepare() and the number of constraints added in convert() */
  DEBUGTFA = false;
  /* True to get GLPK printouts (otherwise the terminal hook swallows them) */
  DEBUGMILP = false;
  /* True to print the lumped reactions as they are computed (suggested true) */
  PRINTLUMPS = true;
  /* True to print the non-zero fluxes of every solution (very large for genome-scale models, suggested false) */
  PRINTSOLUTION = false;

  /************ FLUX and INTEGER precision ( DO NOT CHANGE UNLESS YOU KNOW WHAT YOU ARE DOING!) ************/
  FLUX_CUTOFF = 1E-7;
  INTEGER_CUTOFF = 1E-6;
  /* Lumped coefficients smaller than this are dropped */
  STOICH_CUTOFF = 1E-9;

  /************ Thermodynamic formulation ********************/
  /* Big-M for the flux / use-variable coupling (must be >= any flux bound) */
  BIGM = 1000.0f;
  /* Big-M for the free energy / use-variable coupling (kJ/mol) */
  DG_BIGM = 1000.0f;
  /* A reaction going forward needs DG <= -DG_EPSILON */
  DG_EPSILON = 1E-6;
  /* R*T at 298.15 K in kJ/mol */
  RT = 8.314462618E-3 * 298.15;
  /* Metabolite concentration range (M) */
  MIN_CONC = 1E-5;
  MAX_CONC = 2E-2;
  KCAL_TO_KJ = 4.184;
  /* Compounds with a larger formation energy error are treated as unknown */
  MAX_DG_ERR = 1E6;

  DEFAULT_BOUND = 1000.0f;
  AUTO_GROWTH_FRACTION = 0.95;

  /************ Solver defaults ********************/
  /* Seconds */
  DEFAULT_TIMEOUT = 300.0f;
  DEFAULT_FEASIBILITY = 1E-7;
  DEFAULT_MIP_GAP = 1E-4;
}
