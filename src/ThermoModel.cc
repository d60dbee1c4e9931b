#include <cmath>
#include <cstdio>
#include <map>
#include <vector>

#include "DataStructures.h"
#include "MyConstants.h"
#include "pathUtils.h"
#include "ThermoModel.h"

TFAMODEL::TFAMODEL(const MODEL &inModel, const THERMODB &inDb) {
  model = inModel;
  thermoDb = inDb;
  buildFluxProblem();
}

/* Forward and reverse flux columns for every reaction and one mass balance per non-boundary metabolite */
void TFAMODEL::buildFluxProblem() {
  map<int, LINEXPR> balances;
  for(int i=0; i<model.rxns.rxns.size(); i++) {
    const REACTION &rxn = model.rxns.rxns[i];
    FORWARDFLUXVARIABLE fwd(rxn);
    REVERSEFLUXVARIABLE rev(rxn);
    milp.addVariable(fwd);
    milp.addVariable(rev);
    LINEXPR net = fwd.expr() - rev.expr();
    for(int j=0; j<rxn.stoich.size(); j++) {
      balances[rxn.stoich[j].met_id] += net * rxn.stoich[j].rxn_coeff;
    }
  }

  for(int i=0; i<model.metabolites.mets.size(); i++) {
    const METABOLITE &met = model.metabolites.mets[i];
    if(met.boundary) { continue; }
    map<int, LINEXPR>::iterator it = balances.find(met.id);
    if(it == balances.end() || it->second.empty()) { continue; }
    MASSBALANCE mb(met, it->second);
    milp.addConstraint(mb);
  }
}

/* Key into the database: the seed ID if the model gave one, otherwise the name without its compartment */
string TFAMODEL::thermoKey(const METABOLITE &met) const {
  if(!met.seed_id.empty()) { return met.seed_id; }
  return stripCompartment(met.name);
}

/* Formation energies for every metabolite, reaction energies for every reaction.
   A reaction gets computed = true only if it has both reactants and products and
   every one of its metabolites has data */
void TFAMODEL::prepare() {
  int numMetsWithData(0);
  for(int i=0; i<model.metabolites.mets.size(); i++) {
    METABOLITE &met = model.metabolites.mets[i];
    const THERMOCOMPOUND* cpd = thermoDb.compound(thermoKey(met));
    if(cpd == NULL || cpd->deltaGf_err >= _db.MAX_DG_ERR) {
      met.hasThermo = false;
      met.deltaGf = 0.0f;
      met.deltaGf_err = 0.0f;
      continue;
    }
    met.hasThermo = true;
    met.deltaGf = cpd->deltaGf_std;
    met.deltaGf_err = cpd->deltaGf_err;
    numMetsWithData++;
  }

  int numComputed(0);
  for(int i=0; i<model.rxns.rxns.size(); i++) {
    REACTION &rxn = model.rxns.rxns[i];
    rxn.thermo = THERMORXN();
    if(rxn.isBoundary()) { continue; }
    bool allData(true);
    double dG(0.0f), errSq(0.0f);
    for(int j=0; j<rxn.stoich.size(); j++) {
      const METABOLITE* met = model.metabolites.metPtrFromId(rxn.stoich[j].met_id);
      if(!met->hasThermo) { allData = false; break; }
      dG += rxn.stoich[j].rxn_coeff * met->deltaGf;
      errSq += pow(rxn.stoich[j].rxn_coeff * met->deltaGf_err, 2);
    }
    if(!allData) { continue; }
    rxn.thermo.deltaGR = dG;
    rxn.thermo.deltaGRerr = sqrt(errSq);
    rxn.thermo.computed = true;
    numComputed++;
    if(_db.DEBUGTFA) {
      printf("%s: DG0 = %4.3f +/- %4.3f kJ/mol\n", rxn.name.c_str(), rxn.thermo.deltaGR, rxn.thermo.deltaGRerr);
    }
  }

  if(_db.DEBUGTFA) {
    printf("Thermodynamic data for %d of %d metabolites and %d of %d reactions\n", numMetsWithData,
	   (int)model.metabolites.mets.size(), numComputed, (int)model.rxns.rxns.size());
  }
}

void TFAMODEL::clearThermo() {
  milp.removeConstraints(thermoCons);
  milp.removeVariables(thermoVars);
  thermoCons.clear();
  thermoVars.clear();
}

/* (Re)build the thermodynamic variables and constraints for every reaction with thermo.computed set */
void TFAMODEL::convert() {
  clearThermo();

  double lnLb = log(_db.MIN_CONC);
  double lnUb = log(_db.MAX_CONC);
  double dgBound = _db.DG_BIGM - _db.DG_EPSILON;

  for(int i=0; i<model.rxns.rxns.size(); i++) {
    const REACTION &rxn = model.rxns.rxns[i];
    if(!rxn.thermo.computed) { continue; }

    LINEXPR logConcTerm;
    for(int j=0; j<rxn.stoich.size(); j++) {
      LOGCONCVARIABLE ln(*model.metabolites.metPtrFromId(rxn.stoich[j].met_id), lnLb, lnUb);
      if(!milp.hasVariable(ln.name())) {
	milp.addVariable(ln);
	thermoVars.push_back(ln.name());
      }
      logConcTerm += ln.expr() * (_db.RT * rxn.stoich[j].rxn_coeff);
    }

    DELTAGVARIABLE dg(rxn, -dgBound, dgBound);
    FORWARDUSEVARIABLE fu(rxn);
    BACKWARDUSEVARIABLE bu(rxn);
    milp.addVariable(dg);
    milp.addVariable(fu);
    milp.addVariable(bu);
    thermoVars.push_back(dg.name());
    thermoVars.push_back(fu.name());
    thermoVars.push_back(bu.name());

    vector<GENERICCONSTRAINT*> cons;
    DELTAGDEFINITION defn(rxn, dg, logConcTerm, rxn.thermo.deltaGR, rxn.thermo.deltaGRerr);
    SIMULTANEOUSUSE su(rxn, fu, bu);
    FORWARDFLUXCOUPLING uf(rxn, forwardVariable(rxn.id), fu, _db.BIGM);
    REVERSEFLUXCOUPLING ur(rxn, reverseVariable(rxn.id), bu, _db.BIGM);
    FORWARDDELTAGCOUPLING fg(rxn, dg, fu, _db.DG_BIGM, _db.DG_EPSILON);
    BACKWARDDELTAGCOUPLING bg(rxn, dg, bu, _db.DG_BIGM, _db.DG_EPSILON);
    cons.push_back(&defn);
    cons.push_back(&su);
    cons.push_back(&uf);
    cons.push_back(&ur);
    cons.push_back(&fg);
    cons.push_back(&bg);
    for(int j=0; j<cons.size(); j++) {
      if(milp.addConstraint(*cons[j])) { thermoCons.push_back(cons[j]->name()); }
    }
  }

  if(_db.DEBUGTFA) {
    printf("convert() added %d thermodynamic variables and %d thermodynamic constraints\n",
	   (int)thermoVars.size(), (int)thermoCons.size());
  }
}

int TFAMODEL::optimize(SOLUTION &solution) {
  solution.clear();
  double objValue(0.0f);
  solution.status = milp.solve(solution.primals, objValue);
  if(solution.status != SOLVE_SUCCESS) { return solution.status; }
  solution.objective = objValue;
  for(int i=0; i<model.rxns.rxns.size(); i++) {
    const REACTION &rxn = model.rxns.rxns[i];
    solution.fluxes[rxn.name] = fluxExpression(rxn.id).evaluate(solution.primals);
  }
  if(_db.PRINTSOLUTION) {
    for(map<string, double>::const_iterator it = solution.fluxes.begin(); it != solution.fluxes.end(); ++it) {
      if(fabs(it->second) < _db.FLUX_CUTOFF) { continue; }
      printf("%s\t%4.6f\n", it->first.c_str(), it->second);
    }
  }
  return SOLVE_SUCCESS;
}

bool TFAMODEL::addConsVars(const vector<const GENERICVARIABLE*> &vars, const vector<const GENERICCONSTRAINT*> &cons) {
  bool ok(true);
  for(int i=0; i<vars.size(); i++) {
    if(!milp.addVariable(*vars[i])) { ok = false; }
  }
  for(int i=0; i<cons.size(); i++) {
    if(!milp.addConstraint(*cons[i])) { ok = false; }
  }
  return ok;
}

/* Constraints first so that nothing is left pointing at a removed variable */
void TFAMODEL::removeConsVars(const vector<string> &varNames, const vector<string> &consNames) {
  vector<string> missing = milp.removeConstraints(consNames);
  for(int i=0; i<missing.size(); i++) {
    printf("WARNING: Constraint %s was not in the problem\n", missing[i].c_str());
  }
  missing = milp.removeVariables(varNames);
  for(int i=0; i<missing.size(); i++) {
    printf("WARNING: Variable %s was not in the problem\n", missing[i].c_str());
  }
}

void TFAMODEL::setObjective(const LINEXPR &expr, int sense) {
  milp.setObjective(expr, sense);
}

void TFAMODEL::setParams(const SOLVERPARAMS &params) {
  milp.setParams(params);
}

FORWARDFLUXVARIABLE TFAMODEL::forwardVariable(int rxnId) const {
  return FORWARDFLUXVARIABLE(*model.rxns.rxnPtrFromId(rxnId));
}

REVERSEFLUXVARIABLE TFAMODEL::reverseVariable(int rxnId) const {
  return REVERSEFLUXVARIABLE(*model.rxns.rxnPtrFromId(rxnId));
}

LINEXPR TFAMODEL::fluxExpression(int rxnId) const {
  return forwardVariable(rxnId).expr() - reverseVariable(rxnId).expr();
}

void TFAMODEL::setComputed(int rxnId, bool computed) {
  model.rxns.rxnPtrFromId(rxnId)->thermo.computed = computed;
}

const MODEL& TFAMODEL::getModel() const {
  return model;
}

const GLPKMILP& TFAMODEL::problem() const {
  return milp;
}

int TFAMODEL::numThermoConstraints() const {
  return thermoCons.size();
}
