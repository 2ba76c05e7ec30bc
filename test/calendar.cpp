#include <enumerable.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <iostream>
#include <iomanip>
#include <utility>
#include <cstdint>

namespace greg  = boost::gregorian;
namespace fn    = pseudoenum::fn;
using date_t    = greg::date;
using dates_t   = std::vector<date_t>;

using fn::operators::operator%;

// (month, number of weekend days in the month)
using month_count_t  = std::pair<unsigned, unsigned>;
using month_counts_t = std::vector<month_count_t>;

static bool IsWeekend(const date_t& d)
{
    return d.day_of_week() == greg::Saturday
        || d.day_of_week() == greg::Sunday;
}

static fn::any_enumerable_t<date_t> DaysOfYear(const uint16_t year)
{
    const auto jan1     = date_t( year, greg::Jan, 1 );
    const int  num_days = int((date_t( year, greg::Dec, 31 ) - jan1).days()) + 1;

    return fn::generator(num_days, 0)
         % fn::transform([jan1](int i)
           {
               return jan1 + greg::date_duration{ i };
           });
}

static dates_t FridaysThe13th(const uint16_t year)
{
    return DaysOfYear(year)
         % fn::filter([](const date_t& d)
           {
               return d.day() == 13 && d.day_of_week() == greg::Friday;
           })
         % fn::to_vector();
}

static month_counts_t RankMonthsByWeekendDays(const uint16_t year, const bool descending)
{
    const auto days = DaysOfYear(year);

    auto counts = fn::generator(12, 1)
                % fn::transform([&days](int month) -> month_count_t
                  {
                      const auto weekend_days = days
                          % fn::filter([month](const date_t& d)
                            {
                                return d.month() == month && IsWeekend(d);
                            })
                          % fn::to_vector();

                      return { unsigned(month), unsigned(weekend_days.size()) };
                  });

    // months with equal counts stay in calendar order either way
    return descending ? counts % fn::sort_by_descending(fn::by::second{}) % fn::to_vector()
                      : counts % fn::sort_by(fn::by::second{})            % fn::to_vector();
}

static void PrintRanking(const month_counts_t& ranking, std::ostream& ostr)
{
    ranking % fn::for_each([&](const month_count_t& mc)
    {
        ostr << "  " << greg::greg_month(static_cast<unsigned short>(mc.first)).as_short_string()
             << ": " << std::setw(2) << mc.second << "\n";
    });
}

int main()
{
    const uint16_t year = 2015;

    const auto fridays = FridaysThe13th(year);

    std::cout << "Fridays the 13th in " << year << ":\n";
    fridays % fn::for_each([](const date_t& d)
    {
        std::cout << "  " << greg::to_simple_string(d) << "\n";
    });

    const auto by_most_weekends  = RankMonthsByWeekendDays(year, true);
    const auto by_least_weekends = RankMonthsByWeekendDays(year, false);

    std::cout << "Months by weekend days, most first:\n";
    PrintRanking(by_most_weekends, std::cout);

    const bool ok =
           fridays == dates_t{ date_t( year, greg::Feb, 13 ),
                               date_t( year, greg::Mar, 13 ),
                               date_t( year, greg::Nov, 13 ) }

        && (fridays % fn::for_all([](const date_t& d)
            {
                return d.day_of_week() == greg::Friday;
            }))

        && by_most_weekends.size() == 12
        && by_most_weekends[0] == month_count_t{ 5, 10 }
        && by_most_weekends[1] == month_count_t{ 8, 10 }
        && by_most_weekends[2] == month_count_t{ 1,  9 }

        && by_least_weekends.front() == month_count_t{ 2,  8 }
        && by_least_weekends.back()  == month_count_t{ 8, 10 };

    if(!ok) {
        std::cerr << "Unexpected calendar results for " << year << "\n";
        return 1;
    }

    return 0;
}

/*
Output:
Fridays the 13th in 2015:
  2015-Feb-13
  2015-Mar-13
  2015-Nov-13
Months by weekend days, most first:
  May: 10
  Aug: 10
  Jan:  9
  Mar:  9
  Oct:  9
  Nov:  9
  Feb:  8
  Apr:  8
  Jun:  8
  Jul:  8
  Sep:  8
  Dec:  8
*/
