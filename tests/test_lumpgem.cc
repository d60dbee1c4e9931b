#include <gtest/gtest.h>

#include "Constraints.h"
#include "DataStructures.h"
#include "Lumpgem.h"
#include "Printers.h"
#include "TestNetwork.h"

#include <cmath>
#include <cstdio>
#include <string>

static double lumpCoeff(const NETREACTION &lump, int metId) {
  for(int i=0; i<lump.rxn.stoich.size(); i++) {
    if(lump.rxn.stoich[i].met_id == metId) { return lump.rxn.stoich[i].rxn_coeff; }
  }
  return 0.0;
}

class LumpgemTest : public testing::Test {
 protected:
  MODEL model;
  THERMODB db;
  LUMPPARAMS params;

  void SetUp() {
    model = makeTestNetwork();
    db = makeTestThermoDB();
    params = makeTestParams();
  }

  int rxnId(const char* name) const { return model.rxns.idFromName(name); }
  int metId(const char* name) const { return model.metabolites.idFromName(name); }
};

TEST_F(LumpgemTest, OneIndicatorAndOneCouplingPerNonCoreReaction) {
  LUMPGEM lumpgem(model, db, params);
  const vector<LUMPINDICATORVARIABLE> &indicators = lumpgem.getIndicators();
  ASSERT_EQ(indicators.size(), lumpgem.getPartition().noncore.size());
  ASSERT_EQ(indicators.size(), 1u);
  EXPECT_EQ(indicators[0].name(), "LC_R3");
  EXPECT_EQ(indicators[0].kind, VAR_BINARY);

  const GLPKMILP &problem = lumpgem.getTfa().problem();
  EXPECT_EQ(problem.variablesWithPrefix("LC_").size(), 1u);
  EXPECT_EQ(problem.constraintsWithPrefix("CU_").size(), 1u);
  EXPECT_TRUE(problem.hasConstraint("CU_R3"));
}

TEST_F(LumpgemTest, ObjectiveMaximizesSumOfIndicators) {
  LUMPGEM lumpgem(model, db, params);
  const GLPKMILP &problem = lumpgem.getTfa().problem();
  EXPECT_EQ(problem.objectiveSense(), SENSE_MAX);
  ASSERT_EQ(problem.objective().coef.size(), 1u);
  EXPECT_DOUBLE_EQ(problem.objective().coef.find("LC_R3")->second, 1.0);
}

TEST_F(LumpgemTest, RunOptimisationSwitchesThermodynamicsOffForNonCore) {
  LUMPGEM lumpgem(model, db, params);
  SOLUTION solution;
  ASSERT_EQ(lumpgem.runOptimisation(solution), SOLVE_SUCCESS);
  const MODEL &tfaModel = lumpgem.getTfa().getModel();
  EXPECT_FALSE(tfaModel.rxns.rxnPtrFromId(rxnId("R3"))->thermo.computed);
  EXPECT_TRUE(tfaModel.rxns.rxnPtrFromId(rxnId("R1"))->thermo.computed);
  EXPECT_FALSE(lumpgem.getTfa().problem().hasConstraint("G_R3"));
  EXPECT_TRUE(lumpgem.getTfa().problem().hasConstraint("G_R1"));
}

TEST_F(LumpgemTest, LumpsToyNetwork) {
  LUMPGEM lumpgem(model, db, params);
  NETREACTION lump;
  SOLUTION solution;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), lump, solution), SOLVE_SUCCESS);

  EXPECT_NEAR(solution.flux("R1"), 0.1, 1E-6);
  EXPECT_NEAR(solution.flux("R2"), 0.1, 1E-6);
  EXPECT_NEAR(solution.flux("R3"), 0.2, 1E-6);
  EXPECT_NEAR(solution.flux("B"), 0.1, 1E-6);

  /* R3 has to run, so its indicator is off and it adds nothing */
  EXPECT_NEAR(solution.primal("LC_R3"), 0.0, 1E-6);
  double expectedM1 = -1.0 * solution.flux("R1") - 1.0 * solution.flux("R2")
    + 1.0 * solution.flux("R3") * solution.primal("LC_R3");
  EXPECT_NEAR(lumpCoeff(lump, metId("M1")), expectedM1, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M1")), -0.2, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M2")), 0.1, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M3")), 0.1, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("S")), 0.0, 1E-6);
  EXPECT_EQ(lump.rxn.name, "LUMP_B");
  EXPECT_EQ(lump.rxnIds.size(), 2u);
}

TEST_F(LumpgemTest, SolutionSatisfiesCouplingAndObjectiveCountsIndicators) {
  LUMPGEM lumpgem(model, db, params);
  NETREACTION lump;
  SOLUTION solution;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), lump, solution), SOLVE_SUCCESS);

  const REACTION &r3 = *model.rxns.rxnPtrFromId(rxnId("R3"));
  CARBONUPTAKECOUPLING cu(r3, FORWARDFLUXVARIABLE(r3), REVERSEFLUXVARIABLE(r3), LUMPINDICATORVARIABLE(r3), params.carbonUptake);
  EXPECT_TRUE(cu.satisfiedBy(solution.primals, 1E-6));

  int numOn(0);
  const vector<LUMPINDICATORVARIABLE> &indicators = lumpgem.getIndicators();
  for(int i=0; i<indicators.size(); i++) {
    if(fabs(solution.primal(indicators[i].name()) - 1.0) < 1E-6) { numOn++; }
  }
  EXPECT_NEAR(solution.objective, (double)numOn, 1E-6);
  EXPECT_LE(solution.objective, (double)lumpgem.getPartition().noncore.size() + 1E-6);
}

TEST_F(LumpgemTest, GrowthConstraintIsGoneAfterLumping) {
  LUMPGEM lumpgem(model, db, params);
  SOLUTION solution;
  ASSERT_EQ(lumpgem.runOptimisation(solution), SOLVE_SUCCESS);
  int baseline = lumpgem.getTfa().problem().numConstraints();

  NETREACTION lump;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), lump), SOLVE_SUCCESS);
  EXPECT_EQ(lumpgem.getTfa().problem().numConstraints(), baseline);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());
}

TEST_F(LumpgemTest, LumpingTwiceGivesTheSameLump) {
  LUMPGEM lumpgem(model, db, params);
  NETREACTION first, second;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), first), SOLVE_SUCCESS);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), second), SOLVE_SUCCESS);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());
  EXPECT_TRUE(first == second);
}

TEST_F(LumpgemTest, GrowthConstraintIsGoneAfterFailedSolve) {
  /* B can carry at most 0.1 */
  params.growthRate = 1.0;
  LUMPGEM lumpgem(model, db, params);
  SOLUTION solution;
  ASSERT_EQ(lumpgem.runOptimisation(solution), SOLVE_SUCCESS);
  int baseline = lumpgem.getTfa().problem().numConstraints();

  NETREACTION lump;
  EXPECT_NE(lumpgem.lumpReaction(rxnId("B"), lump), SOLVE_SUCCESS);
  EXPECT_EQ(lumpgem.getTfa().problem().numConstraints(), baseline);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());

  /* The problem is still usable */
  ASSERT_EQ(lumpgem.runOptimisation(solution), SOLVE_SUCCESS);
}

TEST_F(LumpgemTest, UnknownBiomassReaction) {
  LUMPGEM lumpgem(model, db, params);
  NETREACTION lump;
  EXPECT_EQ(lumpgem.lumpReaction(12345, lump), SOLVE_BAD_INPUT);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());
}

TEST_F(LumpgemTest, NoNonCoreReactions) {
  params.coreSubsystems.push_back("Transport");
  LUMPGEM lumpgem(model, db, params);
  EXPECT_TRUE(lumpgem.getPartition().noncore.empty());
  EXPECT_TRUE(lumpgem.getIndicators().empty());
  EXPECT_TRUE(lumpgem.getTfa().problem().objective().empty());

  SOLUTION solution;
  ASSERT_EQ(lumpgem.runOptimisation(solution), SOLVE_SUCCESS);
  EXPECT_NEAR(solution.objective, 0.0, 1E-9);

  NETREACTION lump;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), lump), SOLVE_SUCCESS);
  /* Only core reactions now: R3 moves S into M1 */
  EXPECT_NEAR(lumpCoeff(lump, metId("S")), -0.2, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M1")), 0.0, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M2")), 0.1, 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M3")), 0.1, 1E-6);
}

TEST_F(LumpgemTest, LumpAllGoesThroughEveryBiomassReaction) {
  LUMPGEM lumpgem(model, db, params);
  vector<NETREACTION> lumps;
  vector<int> statuses;
  EXPECT_EQ(lumpgem.lumpAll(lumps, statuses), 0);
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses[0], SOLVE_SUCCESS);
  EXPECT_EQ(lumps.size(), 1u);
}

TEST_F(LumpgemTest, LumpAllCarriesOnAfterAFailedLump) {
  /* B2: M3 --> can never reach the growth rate of 0.1 */
  vector<STOICH> st;
  st.push_back(makeStoich("M3", -1, metId("M3")));
  model.rxns.addReaction(makeReaction(4, "B2", "Core", 0.0f, 0.05f, st));
  params.biomassRxns.push_back("B2");

  LUMPGEM lumpgem(model, db, params);
  ASSERT_EQ(lumpgem.getPartition().biomass.size(), 2u);
  vector<NETREACTION> lumps;
  vector<int> statuses;
  EXPECT_EQ(lumpgem.lumpAll(lumps, statuses), 1);

  /* Statuses follow the biomass set (ordered by reaction ID) */
  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses[0], SOLVE_SUCCESS);
  EXPECT_EQ(statuses[1], SOLVE_INFEASIBLE);
  ASSERT_EQ(lumps.size(), 1u);
  EXPECT_EQ(lumps[0].rxn.name, "LUMP_B");
  EXPECT_NEAR(lumpCoeff(lumps[0], metId("M2")), 0.1, 1E-6);
  EXPECT_TRUE(lumpgem.getTfa().problem().constraintsWithPrefix("GR_").empty());
}

TEST_F(LumpgemTest, WritesLumpFile) {
  LUMPGEM lumpgem(model, db, params);
  vector<NETREACTION> lumps;
  vector<int> statuses;
  ASSERT_EQ(lumpgem.lumpAll(lumps, statuses), 0);

  string path = testing::TempDir() + "lumps_out.tsv";
  ASSERT_TRUE(LUMPS_out(path.c_str(), lumps, model.rxns));

  FILE* fid = fopen(path.c_str(), "r");
  ASSERT_TRUE(fid != NULL);
  char buffer[1024];
  ASSERT_TRUE(fgets(buffer, sizeof(buffer), fid) != NULL);
  EXPECT_EQ(string(buffer), "name\tformula\treactions\n");
  ASSERT_TRUE(fgets(buffer, sizeof(buffer), fid) != NULL);
  char rest[16];
  EXPECT_TRUE(fgets(rest, sizeof(rest), fid) == NULL);
  fclose(fid);

  string line(buffer);
  size_t tab1 = line.find('\t');
  ASSERT_NE(tab1, string::npos);
  size_t tab2 = line.find('\t', tab1 + 1);
  ASSERT_NE(tab2, string::npos);
  EXPECT_EQ(line.substr(0, tab1), "LUMP_B");

  string formula = line.substr(tab1 + 1, tab2 - tab1 - 1);
  EXPECT_EQ(formula, rxnFormula(lumps[0].rxn));
  EXPECT_EQ(formula.find("0.2000 M1 --> "), 0u);
  EXPECT_NE(formula.find("0.1000 M2"), string::npos);
  EXPECT_NE(formula.find("0.1000 M3"), string::npos);

  EXPECT_EQ(line.substr(tab2 + 1), "R1(0.100000),R2(0.100000)\n");
}

TEST_F(LumpgemTest, AutomaticGrowthRate) {
  params.autoGrowth = true;
  params.growthRate = 0.0;
  ASSERT_EQ(resolveGrowthRate(model, db, params), SOLVE_SUCCESS);
  EXPECT_NEAR(params.growthRate, 0.95 * 0.1, 1E-6);

  LUMPGEM lumpgem(model, db, params);
  NETREACTION lump;
  SOLUTION solution;
  ASSERT_EQ(lumpgem.lumpReaction(rxnId("B"), lump, solution), SOLVE_SUCCESS);
  EXPECT_GE(solution.flux("B"), params.growthRate - 1E-6);
  EXPECT_NEAR(lumpCoeff(lump, metId("M2")), solution.flux("B"), 1E-6);
}
