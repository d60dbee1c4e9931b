#include <gtest/gtest.h>

#include "Constraints.h"
#include "DataStructures.h"
#include "TestNetwork.h"
#include "Variables.h"

#include <map>
#include <string>

TEST(LinExpr, ArithmeticAndEvaluation) {
  LINEXPR a("x", 2.0);
  LINEXPR b("y", 1.0);
  LINEXPR sum = a + b * 3.0 - LINEXPR(1.0);
  EXPECT_DOUBLE_EQ(sum.coef["x"], 2.0);
  EXPECT_DOUBLE_EQ(sum.coef["y"], 3.0);
  EXPECT_DOUBLE_EQ(sum.constant, -1.0);

  map<string, double> primals;
  primals["x"] = 1.0;
  /* y is missing and counts as zero */
  EXPECT_DOUBLE_EQ(sum.evaluate(primals), 1.0);
}

TEST(LinExpr, CompactDropsCancelledTerms) {
  LINEXPR e = LINEXPR("x", 1.0) - LINEXPR("x", 1.0) + LINEXPR("y", 2.0);
  EXPECT_FALSE(e.empty());
  e.compact();
  EXPECT_EQ(e.coef.size(), 1u);
  EXPECT_TRUE((LINEXPR("x", 1.0) - LINEXPR("x", 1.0)).empty());
}

TEST(Variables, PrefixesAndBounds) {
  MODEL model = makeTestNetwork();
  const REACTION &r1 = *model.rxns.rxnPtrFromId(model.rxns.idFromName("R1"));
  const REACTION &b = *model.rxns.rxnPtrFromId(model.rxns.idFromName("B"));
  const METABOLITE &m1 = *model.metabolites.metPtrFromId(model.metabolites.idFromName("M1"));

  FORWARDFLUXVARIABLE f(r1);
  REVERSEFLUXVARIABLE r(r1);
  EXPECT_EQ(f.name(), "F_R1");
  EXPECT_EQ(r.name(), "R_R1");
  EXPECT_DOUBLE_EQ(f.lb, 0.0);
  EXPECT_DOUBLE_EQ(f.ub, 1000.0);
  EXPECT_DOUBLE_EQ(r.lb, 0.0);
  EXPECT_DOUBLE_EQ(r.ub, 1000.0);

  /* B only goes forward */
  REVERSEFLUXVARIABLE rb(b);
  EXPECT_DOUBLE_EQ(rb.ub, 0.0);

  EXPECT_EQ(LUMPINDICATORVARIABLE(r1).name(), "LC_R1");
  EXPECT_EQ(LUMPINDICATORVARIABLE(r1).kind, VAR_BINARY);
  EXPECT_EQ(FORWARDUSEVARIABLE(r1).name(), "FU_R1");
  EXPECT_EQ(BACKWARDUSEVARIABLE(r1).name(), "BU_R1");
  EXPECT_EQ(DELTAGVARIABLE(r1, -10.0, 10.0).name(), "DG_R1");
  EXPECT_EQ(LOGCONCVARIABLE(m1, -5.0, 0.0).name(), "LN_M1");
  EXPECT_EQ(LOGCONCVARIABLE(m1, -5.0, 0.0).kind, VAR_CONTINUOUS);
}

TEST(Constraints, PrefixesOfEveryKind) {
  MODEL model = makeTestNetwork();
  const REACTION &r1 = *model.rxns.rxnPtrFromId(model.rxns.idFromName("R1"));
  const METABOLITE &m1 = *model.metabolites.metPtrFromId(model.metabolites.idFromName("M1"));
  FORWARDFLUXVARIABLE f(r1);
  REVERSEFLUXVARIABLE r(r1);
  LUMPINDICATORVARIABLE z(r1);
  FORWARDUSEVARIABLE fu(r1);
  BACKWARDUSEVARIABLE bu(r1);
  DELTAGVARIABLE dg(r1, -100.0, 100.0);

  EXPECT_EQ(MASSBALANCE(m1, f.expr()).name(), "MB_M1");
  EXPECT_EQ(CARBONUPTAKECOUPLING(r1, f, r, z, 10.0).name(), "CU_R1");
  EXPECT_EQ(GROWTHCONSTRAINT(r1, f.expr() - r.expr(), 0.1).name(), "GR_R1");
  EXPECT_EQ(DELTAGDEFINITION(r1, dg, LINEXPR(), -5.0, 1.0).name(), "G_R1");
  EXPECT_EQ(SIMULTANEOUSUSE(r1, fu, bu).name(), "SU_R1");
  EXPECT_EQ(FORWARDFLUXCOUPLING(r1, f, fu, 1000.0).name(), "UF_R1");
  EXPECT_EQ(REVERSEFLUXCOUPLING(r1, r, bu, 1000.0).name(), "UR_R1");
  EXPECT_EQ(FORWARDDELTAGCOUPLING(r1, dg, fu, 1000.0, 1E-6).name(), "FG_R1");
  EXPECT_EQ(BACKWARDDELTAGCOUPLING(r1, dg, bu, 1000.0, 1E-6).name(), "BG_R1");
}

TEST(Constraints, CarbonUptakeCouplingShape) {
  MODEL model = makeTestNetwork();
  const REACTION &r3 = *model.rxns.rxnPtrFromId(model.rxns.idFromName("R3"));
  FORWARDFLUXVARIABLE f(r3);
  REVERSEFLUXVARIABLE r(r3);
  LUMPINDICATORVARIABLE z(r3);
  CARBONUPTAKECOUPLING cu(r3, f, r, z, 10.0);

  EXPECT_DOUBLE_EQ(cu.expr.coef["F_R3"], 1.0);
  EXPECT_DOUBLE_EQ(cu.expr.coef["R_R3"], 1.0);
  EXPECT_DOUBLE_EQ(cu.expr.coef["LC_R3"], 10.0);
  EXPECT_DOUBLE_EQ(cu.ub, 10.0);
  EXPECT_TRUE(cu.lb < -1E30);

  map<string, double> primals;
  primals["F_R3"] = 4.0;
  primals["LC_R3"] = 0.0;
  EXPECT_TRUE(cu.satisfiedBy(primals, 1E-9));
  primals["LC_R3"] = 1.0;
  EXPECT_FALSE(cu.satisfiedBy(primals, 1E-9));
  primals["F_R3"] = 0.0;
  EXPECT_TRUE(cu.satisfiedBy(primals, 1E-9));
}

TEST(Constraints, DeltaGDefinitionIsRanged) {
  MODEL model = makeTestNetwork();
  const REACTION &r1 = *model.rxns.rxnPtrFromId(model.rxns.idFromName("R1"));
  DELTAGVARIABLE dg(r1, -100.0, 100.0);
  DELTAGDEFINITION g(r1, dg, LINEXPR("LN_M2", 2.0), -10.0, 2.0);
  EXPECT_DOUBLE_EQ(g.lb, -12.0);
  EXPECT_DOUBLE_EQ(g.ub, -8.0);
  EXPECT_DOUBLE_EQ(g.expr.coef["DG_R1"], 1.0);
  EXPECT_DOUBLE_EQ(g.expr.coef["LN_M2"], -2.0);
}
