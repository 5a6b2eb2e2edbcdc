// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "MonthlyFinancials.h"

namespace ebitdascope
{
  double MonthlyFinancials::getTotalOpex() const
  {
    // Fixed summation order keeps the total bit-for-bit reproducible
    double total = 0.0;
    for (OpexCategory category : allOpexCategories())
      total += getOpex(category);

    return total;
  }

} // namespace ebitdascope
