#include "DataStructures.h"
#include "MyConstants.h"
#include "pathUtils.h"

#include <assert.h>
#include <cstdio>
#include <map>
#include <vector>

using std::map;
using std::vector;

METABOLITE::METABOLITE() {
  id = -1;
  charge = 0;
  boundary = false;
  hasThermo = false;
  deltaGf = 0.0f;
  deltaGf_err = 0.0f;
}

bool STOICH::operator==(const STOICH &rhs) const{
  return (this[0].rxn_coeff == rhs.rxn_coeff);
}

bool STOICH::operator<(const STOICH &rhs) const{
  return (this[0].rxn_coeff < rhs.rxn_coeff);
}

STOICH::STOICH() {
  met_id = -1;
  rxn_coeff = 999;
}

THERMORXN::THERMORXN() {
  deltaGR = 0.0f;
  deltaGRerr = 0.0f;
  computed = false;
}

REACTION::REACTION(){
  id = -1;
  lb = -_db.DEFAULT_BOUND;
  ub = _db.DEFAULT_BOUND;
}

bool REACTION::isBoundary() const {
  bool hasReactant(false), hasProduct(false);
  for(int i=0; i<stoich.size(); i++) {
    if(stoich[i].rxn_coeff < 0.0f) { hasReactant = true; }
    if(stoich[i].rxn_coeff > 0.0f) { hasProduct = true; }
  }
  return !(hasReactant && hasProduct);
}

double REACTION::coeffOf(int met_id) const {
  for(int i=0; i<stoich.size(); i++) {
    if(stoich[i].met_id == met_id) { return stoich[i].rxn_coeff; }
  }
  return 0.0f;
}

/* Two NETREACTIONs are the same if they were built from the same reactions and have the same stoichiometry */
bool NETREACTION::operator==(const NETREACTION &rhs) const{
  if(this[0].rxnIds != rhs.rxnIds) { return false; }
  if(this[0].rxn.stoich.size() != rhs.rxn.stoich.size()) { return false; }
  for(int i=0; i<rhs.rxn.stoich.size(); i++) {
    if(this[0].rxn.stoich[i].met_id != rhs.rxn.stoich[i].met_id) { return false; }
    if(!rougheq(this[0].rxn.stoich[i].rxn_coeff, rhs.rxn.stoich[i].rxn_coeff, _db.FLUX_CUTOFF)) { return false; }
  }
  return true;
}

void PARTITION::clear() {
  biomass.clear();
  core.clear();
  noncore.clear();
  coreMets.clear();
}

int PARTITION::size() const {
  return biomass.size() + core.size() + noncore.size();
}

THERMOCOMPOUND::THERMOCOMPOUND() {
  charge_std = 0;
  deltaGf_std = 0.0f;
  deltaGf_err = 0.0f;
}

bool THERMODB::hasCompound(const string &id) const {
  return compounds.count(id) > 0;
}

const THERMOCOMPOUND* THERMODB::compound(const string &id) const {
  map<string, THERMOCOMPOUND>::const_iterator it = compounds.find(id);
  if(it == compounds.end()) { return NULL; }
  return &(it->second);
}

void THERMODB::clear() {
  name.clear();
  units.clear();
  compounds.clear();
}

SOLUTION::SOLUTION() {
  status = SOLVE_SUCCESS;
  objective = 0.0f;
}

void SOLUTION::clear() {
  status = SOLVE_SUCCESS;
  objective = 0.0f;
  fluxes.clear();
  primals.clear();
}

double SOLUTION::flux(const string &rxnName) const {
  map<string, double>::const_iterator it = fluxes.find(rxnName);
  if(it == fluxes.end()) { return 0.0f; }
  return it->second;
}

double SOLUTION::primal(const string &varName) const {
  map<string, double>::const_iterator it = primals.find(varName);
  if(it == primals.end()) { return 0.0f; }
  return it->second;
}

LUMPPARAMS::LUMPPARAMS() {
  carbonUptake = 0.0f;
  growthRate = 0.0f;
  autoGrowth = false;
  timeout = _db.DEFAULT_TIMEOUT;
  feasibility = _db.DEFAULT_FEASIBILITY;
  mipGap = _db.DEFAULT_MIP_GAP;
}

MODEL::MODEL() {
}

void MODEL::clear() {
  name.clear();
  rxns.clear();
  metabolites.clear();
}

/* I think I'm required to put this here...even if it does nothing*/
RXNSPACE::RXNSPACE() {
}

RXNSPACE::RXNSPACE(const vector<REACTION> &rxnVec) {
  for(int i=0;i<rxnVec.size();i++){
    addReaction(rxnVec[i]);
  }
}

void RXNSPACE::clear() {
  rxns.clear();
  Ids2Idx.clear();
  Names2Ids.clear();
}

/* Note - I implemented this myself so that I automatically reserve the capacity... */
RXNSPACE& RXNSPACE::operator=(const RXNSPACE &orig) {
  if(&orig != this) {
    clear();
    rxns.reserve(orig.rxns.capacity());
    for(int i=0; i<orig.rxns.size(); i++) {
      addReaction(orig.rxns[i]);
    }
  }
  return *this;
}

/* Reactions whose ID or name is already present are skipped */
void RXNSPACE::addReaction(const REACTION &rxn) {
  if(idIn(rxn.id)) {
    printf("WARNING: Attempted to add a reaction with id %d that was already in the RXNSPACE\n", rxn.id);
    return;
  }
  if(nameIn(rxn.name)) {
    printf("WARNING: Attempted to add a second reaction named %s to the RXNSPACE\n", rxn.name.c_str());
    return;
  }
  rxns.push_back(rxn);
  Ids2Idx[rxn.id] = rxns.size()-1;
  Names2Ids[rxn.name] = rxn.id;
}

void RXNSPACE::change_Lb(int id, double new_lb) {
  REACTION* ptr = rxnPtrFromId(id);
  if(new_lb > ptr->ub) {
    printf("WARNING: New lower bound %4.3f for reaction %s is above its upper bound - raising the upper bound too\n", new_lb, ptr->name.c_str());
    ptr->ub = new_lb;
  }
  ptr->lb = new_lb;
}

REACTION* RXNSPACE::rxnPtrFromId(int id) {
  int idx = this->idxFromId(id);
  return &rxns[idx];
}

const REACTION* RXNSPACE::rxnPtrFromId(int id) const {
  int idx = this->idxFromId(id);
  return &rxns[idx];
}

/* Returns a reaction index from an Id (does bounds-checking) */
int RXNSPACE::idxFromId(int id) const {
  map<int,int>::const_iterator it = Ids2Idx.find(id);
  if(it == Ids2Idx.end()) {
    printf("FAILURE: Attempt to get an index for ID %d that is not in the RXNSPACE(%d)!\n",
	   id,(int)this->rxns.size());
    assert(it != Ids2Idx.end() );
  }
  return (it -> second);
}

int RXNSPACE::idFromName(const string &name) const {
  map<string,int>::const_iterator it = Names2Ids.find(name);
  if(it == Names2Ids.end()) { return -1; }
  return it->second;
}

bool RXNSPACE::idIn(int id) const {
  return Ids2Idx.count(id) > 0;
}

bool RXNSPACE::nameIn(const string &name) const {
  return Names2Ids.count(name) > 0;
}

/* I think I'm required to put this here...even if it does nothing*/
METSPACE::METSPACE() {
}

METSPACE::METSPACE(const vector<METABOLITE> &metVec) {
  for(int i=0; i<metVec.size(); i++) {
    addMetabolite(metVec[i]);
  }
}

void METSPACE::clear() {
  mets.clear();
  Ids2Idx.clear();
  Names2Ids.clear();
}

METSPACE& METSPACE::operator=(const METSPACE &orig) {
  if(&orig != this) {
    clear();
    mets.reserve(orig.mets.capacity());
    for(int i=0; i<orig.mets.size(); i++) {
      addMetabolite(orig.mets[i]);
    }
  }
  return *this;
}

void METSPACE::addMetabolite(const METABOLITE &met) {
  if(idIn(met.id)) {
    printf("WARNING: Attempted to add a metabolite with id %d that was already in the METSPACE\n", met.id);
    return;
  }
  if(nameIn(met.name)) {
    printf("WARNING: Attempted to add a second metabolite named %s to the METSPACE\n", met.name.c_str());
    return;
  }
  mets.push_back(met);
  Ids2Idx[met.id] = mets.size()-1;
  Names2Ids[met.name] = met.id;
}

METABOLITE* METSPACE::metPtrFromId(int id) {
  int idx = this->idxFromId(id);
  return &mets[idx];
}

const METABOLITE* METSPACE::metPtrFromId(int id) const {
  int idx = this->idxFromId(id);
  return &mets[idx];
}

int METSPACE::idxFromId(int id) const {
  map<int,int>::const_iterator it = Ids2Idx.find(id);
  if(it == Ids2Idx.end()) {
    printf("FAILURE: Attempt to get an index for metabolite ID %d that is not in the METSPACE(%d)!\n",
	   id, (int)this->mets.size());
    assert(it != Ids2Idx.end());
  }
  return (it -> second);
}

int METSPACE::idFromName(const string &name) const {
  map<string,int>::const_iterator it = Names2Ids.find(name);
  if(it == Names2Ids.end()) { return -1; }
  return it->second;
}

bool METSPACE::idIn(int id) const {
  return Ids2Idx.count(id) > 0;
}

bool METSPACE::nameIn(const string &name) const {
  return Names2Ids.count(name) > 0;
}

