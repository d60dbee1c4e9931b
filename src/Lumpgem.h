#include <vector>
#include "DataStructures.h"
#include "Variables.h"
#include "Constraints.h"
#include "ThermoModel.h"

#ifndef LUMPGEM_H
#define LUMPGEM_H

/* Lumped reactions for biomass building blocks.

   The constructor partitions the model into biomass / core / non-core reactions and sets up,
   once and for all, one binary indicator LC_r and one coupling constraint
   F_r + R_r + C * LC_r <= C per non-core reaction (C = carbon uptake), with the objective
   max sum(LC_r). Every lumpReaction() call only adds a growth constraint on the biomass
   reaction being lumped, solves, and takes it away again.

   One LUMPGEM owns one problem - lump biomass reactions one after another, never from two threads. */
class LUMPGEM {
 public:
  LUMPGEM(const MODEL &model, const THERMODB &thermoDb, const LUMPPARAMS &params);

  /* prepare(), switch thermodynamics off for non-core reactions, convert(), optimize() */
  int runOptimisation(SOLUTION &solution);

  /* Returns a SOLVE_* code. lump is only filled in on SOLVE_SUCCESS. The growth constraint
     is gone again when this returns, whatever happened */
  int lumpReaction(int bioRxnId, NETREACTION &lump);
  int lumpReaction(int bioRxnId, NETREACTION &lump, SOLUTION &solution);

  /* Lump every biomass reaction in ID order. statuses[i] belongs to partition.biomass entry i;
     lumps only has the successful ones. Returns the number of failures */
  int lumpAll(vector<NETREACTION> &lumps, vector<int> &statuses);

  const PARTITION& getPartition() const;
  const vector<LUMPINDICATORVARIABLE>& getIndicators() const;
  const TFAMODEL& getTfa() const;

 private:
  TFAMODEL tfa;
  PARTITION partition;
  vector<LUMPINDICATORVARIABLE> indicators;
  double carbonUptake;
  double growthRate;

  void generateBinaryVariables();
  void generateConstraints();
  void generateObjective();

  LUMPGEM(const LUMPGEM &);
  LUMPGEM& operator=(const LUMPGEM &);
};

/* Holds a growth constraint in the problem for as long as it lives */
class GROWTHSCOPE {
 public:
  GROWTHSCOPE(TFAMODEL &inTfa, const GROWTHCONSTRAINT &growth);
  ~GROWTHSCOPE();
  bool active() const;

 private:
  TFAMODEL &tfa;
  string consName;
  bool added;

  GROWTHSCOPE(const GROWTHSCOPE &);
  GROWTHSCOPE& operator=(const GROWTHSCOPE &);
};

SOLVERPARAMS solverParamsFrom(const LUMPPARAMS &params);

/* Maximum net flux through rxnName on its own TFA problem (thermodynamics on for every reaction with data) */
int maxTfaFlux(const MODEL &model, const THERMODB &thermoDb, const string &rxnName, const SOLVERPARAMS &solverParams,
	       double &maxFlux);

/* If params.autoGrowth is set, replace params.growthRate with AUTO_GROWTH_FRACTION times the maximum flux
   through params.objectiveRxn (or the first biomass reaction when that is empty) */
int resolveGrowthRate(const MODEL &model, const THERMODB &thermoDb, LUMPPARAMS &params);

#endif
