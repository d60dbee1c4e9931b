#include <cmath>
#include <cstdio>
#include <map>
#include <set>
#include <vector>

#include "DataStructures.h"
#include "Lumpgem.h"
#include "MyConstants.h"
#include "Partition.h"
#include "pathUtils.h"

/**************** GROWTHSCOPE ****************/

GROWTHSCOPE::GROWTHSCOPE(TFAMODEL &inTfa, const GROWTHCONSTRAINT &growth) : tfa(inTfa) {
  consName = growth.name();
  vector<const GENERICVARIABLE*> noVars;
  vector<const GENERICCONSTRAINT*> cons(1, &growth);
  added = tfa.addConsVars(noVars, cons);
}

GROWTHSCOPE::~GROWTHSCOPE() {
  if(!added) { return; }
  vector<string> noVars;
  vector<string> cons(1, consName);
  tfa.removeConsVars(noVars, cons);
}

bool GROWTHSCOPE::active() const {
  return added;
}

/**************** LUMPGEM ****************/

LUMPGEM::LUMPGEM(const MODEL &model, const THERMODB &thermoDb, const LUMPPARAMS &params) : tfa(model, thermoDb) {
  carbonUptake = params.carbonUptake;
  growthRate = params.growthRate;
  tfa.setParams(solverParamsFrom(params));

  vector<string> missing = missingReactions(model.rxns, params.biomassRxns);
  for(int i=0; i<missing.size(); i++) {
    printf("WARNING: Biomass reaction %s is not in the model\n", missing[i].c_str());
  }

  set<string> biomassNames(params.biomassRxns.begin(), params.biomassRxns.end());
  set<string> coreSubsystems(params.coreSubsystems.begin(), params.coreSubsystems.end());
  partitionNetwork(model.rxns, biomassNames, coreSubsystems, partition);
  if(partition.core.empty()) {
    printf("WARNING: No reaction belongs to a core subsystem - every non-biomass reaction is non-core\n");
  }
  printf("%d biomass, %d core and %d non-core reactions\n", (int)partition.biomass.size(),
	 (int)partition.core.size(), (int)partition.noncore.size());

  generateBinaryVariables();
  generateConstraints();
  generateObjective();
}

void LUMPGEM::generateBinaryVariables() {
  const RXNSPACE &rxns = tfa.getModel().rxns;
  vector<const GENERICVARIABLE*> vars;
  indicators.reserve(partition.noncore.size());
  for(set<int>::const_iterator it = partition.noncore.begin(); it != partition.noncore.end(); ++it) {
    indicators.push_back(LUMPINDICATORVARIABLE(*rxns.rxnPtrFromId(*it)));
  }
  /* Pointers only after the vector stops growing */
  for(int i=0; i<indicators.size(); i++) { vars.push_back(&indicators[i]); }
  tfa.addConsVars(vars, vector<const GENERICCONSTRAINT*>());
}

/* F + R + C * LC <= C for every non-core reaction */
void LUMPGEM::generateConstraints() {
  const RXNSPACE &rxns = tfa.getModel().rxns;
  vector<CARBONUPTAKECOUPLING> couplings;
  couplings.reserve(indicators.size());
  int i(0);
  for(set<int>::const_iterator it = partition.noncore.begin(); it != partition.noncore.end(); ++it, ++i) {
    couplings.push_back(CARBONUPTAKECOUPLING(*rxns.rxnPtrFromId(*it), tfa.forwardVariable(*it), tfa.reverseVariable(*it),
					     indicators[i], carbonUptake));
  }
  vector<const GENERICCONSTRAINT*> cons;
  for(int j=0; j<couplings.size(); j++) { cons.push_back(&couplings[j]); }
  tfa.addConsVars(vector<const GENERICVARIABLE*>(), cons);
}

void LUMPGEM::generateObjective() {
  LINEXPR obj;
  for(int i=0; i<indicators.size(); i++) { obj += indicators[i].expr(); }
  tfa.setObjective(obj, SENSE_MAX);
}

int LUMPGEM::runOptimisation(SOLUTION &solution) {
  tfa.prepare();
  for(set<int>::const_iterator it = partition.noncore.begin(); it != partition.noncore.end(); ++it) {
    tfa.setComputed(*it, false);
  }
  tfa.convert();
  return tfa.optimize(solution);
}

int LUMPGEM::lumpReaction(int bioRxnId, NETREACTION &lump) {
  SOLUTION solution;
  return lumpReaction(bioRxnId, lump, solution);
}

int LUMPGEM::lumpReaction(int bioRxnId, NETREACTION &lump, SOLUTION &solution) {
  const MODEL &model = tfa.getModel();
  if(!model.rxns.idIn(bioRxnId)) {
    printf("ERROR: Reaction ID %d is not in the model - nothing to lump\n", bioRxnId);
    return SOLVE_BAD_INPUT;
  }
  const REACTION &bio = *model.rxns.rxnPtrFromId(bioRxnId);

  GROWTHCONSTRAINT growth(bio, tfa.fluxExpression(bioRxnId), growthRate);
  GROWTHSCOPE scope(tfa, growth);
  if(!scope.active()) {
    printf("ERROR: Could not add the growth constraint for %s\n", bio.name.c_str());
    return SOLVE_BAD_INPUT;
  }

  int status = runOptimisation(solution);
  if(status != SOLVE_SUCCESS) {
    printf("ERROR: No solution while lumping %s\n", bio.name.c_str());
    return status;
  }

  NETREACTION result;
  map<int, double> lumped;
  for(set<int>::const_iterator it = partition.core.begin(); it != partition.core.end(); ++it) {
    const REACTION &rxn = *model.rxns.rxnPtrFromId(*it);
    double weight = solution.flux(rxn.name);
    if(fabs(weight) < _db.FLUX_CUTOFF) { continue; }
    addScaledStoich(lumped, rxn, weight);
    result.rxnIds.push_back(rxn.id);
    result.rxnFluxes.push_back(weight);
    if(_db.DEBUGLUMP) { printf("  core %s\t%4.6f\n", rxn.name.c_str(), weight); }
  }

  /* A non-core reaction counts only as far as its indicator is on */
  for(int i=0; i<indicators.size(); i++) {
    int rxnId = model.rxns.idFromName(indicators[i].hook);
    const REACTION &rxn = *model.rxns.rxnPtrFromId(rxnId);
    double z = solution.primal(indicators[i].name());
    /* Branch and bound leaves integer columns within INTEGER_CUTOFF of 0 or 1 */
    if(z < _db.INTEGER_CUTOFF) { z = 0.0f; }
    else if(z > 1.0f - _db.INTEGER_CUTOFF) { z = 1.0f; }
    double weight = solution.flux(rxn.name) * z;
    if(fabs(weight) < _db.FLUX_CUTOFF) { continue; }
    addScaledStoich(lumped, rxn, weight);
    result.rxnIds.push_back(rxn.id);
    result.rxnFluxes.push_back(weight);
    if(_db.DEBUGLUMP) { printf("  noncore %s\t%4.6f\n", rxn.name.c_str(), weight); }
  }

  result.rxn.name = "LUMP_" + bio.name;
  result.rxn.subsystem = "Lumped";
  result.rxn.lb = 0.0f;
  result.rxn.ub = _db.DEFAULT_BOUND;
  result.rxn.stoich = stoichFromMap(lumped, model.metabolites, _db.STOICH_CUTOFF);
  lump = result;
  return SOLVE_SUCCESS;
}

int LUMPGEM::lumpAll(vector<NETREACTION> &lumps, vector<int> &statuses) {
  lumps.clear();
  statuses.clear();
  int numFailed(0);
  for(set<int>::const_iterator it = partition.biomass.begin(); it != partition.biomass.end(); ++it) {
    const REACTION* bio = tfa.getModel().rxns.rxnPtrFromId(*it);
    printf("Lumping %s...\n", bio->name.c_str());
    NETREACTION lump;
    int status = lumpReaction(*it, lump);
    statuses.push_back(status);
    if(status != SOLVE_SUCCESS) {
      numFailed++;
      continue;
    }
    lumps.push_back(lump);
    printf("...done\n");
  }
  return numFailed;
}

const PARTITION& LUMPGEM::getPartition() const {
  return partition;
}

const vector<LUMPINDICATORVARIABLE>& LUMPGEM::getIndicators() const {
  return indicators;
}

const TFAMODEL& LUMPGEM::getTfa() const {
  return tfa;
}

/**************** Growth rate ****************/

SOLVERPARAMS solverParamsFrom(const LUMPPARAMS &params) {
  SOLVERPARAMS result;
  result.timeout = params.timeout;
  result.feasibility = params.feasibility;
  result.mipGap = params.mipGap;
  return result;
}

int maxTfaFlux(const MODEL &model, const THERMODB &thermoDb, const string &rxnName, const SOLVERPARAMS &solverParams,
	       double &maxFlux) {
  maxFlux = 0.0f;
  int rxnId = model.rxns.idFromName(rxnName);
  if(rxnId == -1) {
    printf("ERROR: Reaction %s to maximize is not in the model\n", rxnName.c_str());
    return SOLVE_BAD_INPUT;
  }
  TFAMODEL tfa(model, thermoDb);
  tfa.setParams(solverParams);
  tfa.prepare();
  tfa.convert();
  tfa.setObjective(tfa.fluxExpression(rxnId), SENSE_MAX);
  SOLUTION solution;
  int status = tfa.optimize(solution);
  if(status != SOLVE_SUCCESS) {
    printf("ERROR: Could not maximize the flux through %s\n", rxnName.c_str());
    return status;
  }
  maxFlux = solution.flux(rxnName);
  return SOLVE_SUCCESS;
}

int resolveGrowthRate(const MODEL &model, const THERMODB &thermoDb, LUMPPARAMS &params) {
  if(!params.autoGrowth) { return SOLVE_SUCCESS; }
  string target = params.objectiveRxn;
  if(target.empty()) {
    if(params.biomassRxns.empty()) {
      printf("ERROR: growth_rate is auto but there is neither an objective_rxn nor a biomass_rxn\n");
      return SOLVE_BAD_INPUT;
    }
    target = params.biomassRxns[0];
  }
  double maxFlux(0.0f);
  int status = maxTfaFlux(model, thermoDb, target, solverParamsFrom(params), maxFlux);
  if(status != SOLVE_SUCCESS) { return status; }
  params.growthRate = _db.AUTO_GROWTH_FRACTION * maxFlux;
  printf("Maximum flux through %s is %4.6f - using a growth rate of %4.6f\n", target.c_str(), maxFlux, params.growthRate);
  return SOLVE_SUCCESS;
}
