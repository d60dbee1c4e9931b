#include <vector>
#include "DataStructures.h"
#include "Variables.h"
#include "Constraints.h"
#include "genericLinprog.h"

#ifndef THERMOMODEL_H
#define THERMOMODEL_H

/* Thermodynamics-based flux analysis on top of a GLPKMILP.

   The flux part (forward / reverse flux columns and mass balances) is built once in the constructor.
   The thermodynamic part is built by convert() for the reactions whose thermo.computed flag is set
   (prepare() sets the flags from the database) and is thrown away and rebuilt by every convert() call,
   so prepare() / convert() can be repeated as often as needed.

   Anything else (indicators, couplings, growth constraints...) belongs to whoever adds it through
   addConsVars / removeConsVars. */
class TFAMODEL {
 public:
  TFAMODEL(const MODEL &inModel, const THERMODB &inDb);

  void prepare();
  void convert();
  int optimize(SOLUTION &solution);

  /* Return false if anything could not be added (the rest is still added) */
  bool addConsVars(const vector<const GENERICVARIABLE*> &vars, const vector<const GENERICCONSTRAINT*> &cons);
  void removeConsVars(const vector<string> &varNames, const vector<string> &consNames);
  void setObjective(const LINEXPR &expr, int sense);
  void setParams(const SOLVERPARAMS &params);

  FORWARDFLUXVARIABLE forwardVariable(int rxnId) const;
  REVERSEFLUXVARIABLE reverseVariable(int rxnId) const;
  /* F_r - R_r */
  LINEXPR fluxExpression(int rxnId) const;

  void setComputed(int rxnId, bool computed);
  const MODEL& getModel() const;
  const GLPKMILP& problem() const;
  int numThermoConstraints() const;

 private:
  MODEL model;
  THERMODB thermoDb;
  GLPKMILP milp;

  /* Names of everything convert() added last time */
  vector<string> thermoVars;
  vector<string> thermoCons;

  void buildFluxProblem();
  void clearThermo();
  string thermoKey(const METABOLITE &met) const;

  /* Not implemented - GLPKMILP is not copyable */
  TFAMODEL(const TFAMODEL &);
  TFAMODEL& operator=(const TFAMODEL &);
};

#endif
