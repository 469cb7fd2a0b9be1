#pragma once
/*
===============================================================================
EXAMPLES — Small programs with known optima
===============================================================================

OVERVIEW
--------
OneFourThree is a two-variable integer program:

    max  143 x + 60 y
    s.t. c1: 120 x + 210 y ≤ 15000
         c2: 110 x +  30 y ≤  4000
         c3:     x +     y ≤    75
         x, y integer

Its optimum is x = 22, y = 52, objective 6266. The "low x" variant adds
x ≤ 16 and moves the optimum to x = 16, y = 59, objective 5828.

These programs back the engine tests and the sample programs.

===============================================================================
*/

#include <unordered_map>

#include "constraints.h"
#include "mp.h"
#include "objective.h"
#include "result.h"
#include "variables.h"

namespace mpkit::examples {

    inline MPBuilder oneFourThree()
    {
        MPBuilder mp("OneFourThree");
        const auto x = Variable::integer("x");
        const auto y = Variable::integer("y");
        mp.addVariable(x);
        mp.addVariable(y);

        mp.setObjective(Objective::max(143 * x + 60 * y));
        mp.add(Constraint::le("c1", 120 * x + 210 * y, 15000));
        mp.add(Constraint::le("c2", 110 * x + 30 * y, 4000));
        mp.add(Constraint::le("c3", x + y, 75));
        return mp;
    }

    inline MPBuilder oneFourThreeLowX()
    {
        MPBuilder mp = oneFourThree();
        const Variable& x = mp.variable("x");
        mp.add(Constraint::le("low x", SumTerms(1 * x), 16));
        return mp;
    }

    inline Solution oneFourThreeSolution()
    {
        const MPBuilder mp = oneFourThree();
        return Solution::of(mp, 6266, {{mp.variable("x"), 22}, {mp.variable("y"), 52}});
    }

    inline Solution oneFourThreeLowXSolution()
    {
        const MPBuilder mp = oneFourThreeLowX();
        return Solution::of(mp, 5828, {{mp.variable("x"), 16}, {mp.variable("y"), 59}});
    }

} // namespace mpkit::examples
