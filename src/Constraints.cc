#include "Constraints.h"

#include <cmath>
#include <string>

using std::string;

GENERICCONSTRAINT::GENERICCONSTRAINT(const string &hookName, const LINEXPR &expression, double lowerBound, double upperBound) {
  hook = hookName;
  expr = expression;
  expr.compact();
  lb = lowerBound;
  ub = upperBound;
}

GENERICCONSTRAINT::~GENERICCONSTRAINT() {
}

string GENERICCONSTRAINT::name() const {
  return string(prefix()) + hook;
}

bool GENERICCONSTRAINT::satisfiedBy(const map<string, double> &primals, double tol) const {
  double value = expr.evaluate(primals);
  if(lb > -NO_BOUND && value < lb - tol) { return false; }
  if(ub < NO_BOUND && value > ub + tol) { return false; }
  return true;
}

MASSBALANCE::MASSBALANCE(const METABOLITE &met, const LINEXPR &expression)
  : GENERICCONSTRAINT(met.name, expression, 0.0f, 0.0f) {
}
const char* MASSBALANCE::prefix() const { return "MB_"; }

/* The same carbon uptake bound multiplies the indicator and bounds the right-hand side */
CARBONUPTAKECOUPLING::CARBONUPTAKECOUPLING(const REACTION &rxn, const GENERICVARIABLE &forward, const GENERICVARIABLE &reverse,
					   const GENERICVARIABLE &indicator, double carbonUptake)
  : GENERICCONSTRAINT(rxn.name, forward.expr() + reverse.expr() + indicator.expr() * carbonUptake, -NO_BOUND, carbonUptake) {
}
const char* CARBONUPTAKECOUPLING::prefix() const { return "CU_"; }

GROWTHCONSTRAINT::GROWTHCONSTRAINT(const REACTION &rxn, const LINEXPR &fluxExpression, double growthRate)
  : GENERICCONSTRAINT(rxn.name, fluxExpression, growthRate, NO_BOUND) {
}
const char* GROWTHCONSTRAINT::prefix() const { return "GR_"; }

DELTAGDEFINITION::DELTAGDEFINITION(const REACTION &rxn, const GENERICVARIABLE &deltaG, const LINEXPR &logConcTerm,
				   double deltaG0, double deltaG0err)
  : GENERICCONSTRAINT(rxn.name, deltaG.expr() - logConcTerm, deltaG0 - deltaG0err, deltaG0 + deltaG0err) {
}
const char* DELTAGDEFINITION::prefix() const { return "G_"; }

SIMULTANEOUSUSE::SIMULTANEOUSUSE(const REACTION &rxn, const GENERICVARIABLE &forwardUse, const GENERICVARIABLE &backwardUse)
  : GENERICCONSTRAINT(rxn.name, forwardUse.expr() + backwardUse.expr(), -NO_BOUND, 1.0f) {
}
const char* SIMULTANEOUSUSE::prefix() const { return "SU_"; }

FORWARDFLUXCOUPLING::FORWARDFLUXCOUPLING(const REACTION &rxn, const GENERICVARIABLE &forward, const GENERICVARIABLE &forwardUse, double bigM)
  : GENERICCONSTRAINT(rxn.name, forward.expr() - forwardUse.expr() * bigM, -NO_BOUND, 0.0f) {
}
const char* FORWARDFLUXCOUPLING::prefix() const { return "UF_"; }

REVERSEFLUXCOUPLING::REVERSEFLUXCOUPLING(const REACTION &rxn, const GENERICVARIABLE &reverse, const GENERICVARIABLE &backwardUse, double bigM)
  : GENERICCONSTRAINT(rxn.name, reverse.expr() - backwardUse.expr() * bigM, -NO_BOUND, 0.0f) {
}
const char* REVERSEFLUXCOUPLING::prefix() const { return "UR_"; }

FORWARDDELTAGCOUPLING::FORWARDDELTAGCOUPLING(const REACTION &rxn, const GENERICVARIABLE &deltaG, const GENERICVARIABLE &forwardUse,
					     double bigK, double epsilon)
  : GENERICCONSTRAINT(rxn.name, deltaG.expr() + forwardUse.expr() * bigK, -NO_BOUND, bigK - epsilon) {
}
const char* FORWARDDELTAGCOUPLING::prefix() const { return "FG_"; }

BACKWARDDELTAGCOUPLING::BACKWARDDELTAGCOUPLING(const REACTION &rxn, const GENERICVARIABLE &deltaG, const GENERICVARIABLE &backwardUse,
					       double bigK, double epsilon)
  : GENERICCONSTRAINT(rxn.name, deltaG.expr() * -1.0f + backwardUse.expr() * bigK, -NO_BOUND, bigK - epsilon) {
}
const char* BACKWARDDELTAGCOUPLING::prefix() const { return "BG_"; }
