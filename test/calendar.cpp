#include <rangeful/fn.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include <array>
#include <iomanip>
#include <iostream>
#include <string>

/*
Prints a year-calendar, `num_months_horizontally` months per row:

         Jan                      Feb                      Mar
 Mo Tu We Th Fr Sa Su     Mo Tu We Th Fr Sa Su     Mo Tu We Th Fr Sa Su
...

Weeks and months are lazy subseqs of the stream of days; nothing but
the formatted lines of the current row of months is materialized.
*/
namespace greg  = boost::gregorian;
using date_t    = greg::date;
using month_t   = date_t::month_type;
using week_t    = std::pair<month_t, std::string>; // (month, formatted-week-line)

static void MakeCalendar(const uint16_t year,
                         const size_t num_months_horizontally,
                         std::ostream& ostr)
{
    namespace fn = rangeful::fn;
    using fn::operators::operator%;

    fn::seq([year, date = date_t( year, greg::Jan, 1 )]() mutable
    {
        auto ret = date;
        date = date + greg::date_duration{ 1 };
        return ret.year() == year ? ret : fn::end_seq();
    })

  % fn::group_adjacent_as_subseqs_by([](const date_t& d)
    {
        return std::make_pair(d.month(), d.week_number());
    })

    // format a line for a week, e.g. "       1  2  3  4  5"
  % fn::transform([](fn::any_seq_t<date_t> wk_dates) -> week_t
    {
        auto wk = std::move(wk_dates) % fn::peekable(1);
        const date_t first = wk.get_gen().peek(0);

        const auto left_pad_amt = size_t(3 * ((first.day_of_week() + 7 - 1) % 7));

        return { first.month(),
                 std::move(wk) % fn::foldl(std::string(left_pad_amt, ' '),
                                           [](std::string ret_wk, const date_t& d)
                    {
                        return std::move(ret_wk)
                             + (d.day() < 10 ? "  " : " ")
                             + std::to_string(d.day());
                    }) };
    })

  % fn::group_adjacent_as_subseqs_by(fn::by::first{}) // by month

  % fn::transform([](fn::any_seq_t<week_t> month_weeks)
    {
        return std::move(month_weeks) % fn::to_vector();
    })

  % fn::in_groups_of(num_months_horizontally)

  % fn::for_each([&](const std::vector<std::vector<week_t>>& row_of_months)
    {
        static const std::array<std::string, 12> s_month_names{{
            "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" }};

        for(int row = -2; row < 6; row++) { // month-name + weekdays-header + up to 6 week-lines
            for(const auto& mo : row_of_months) {
                ostr << std::setiosflags(std::ios::left)
                     << std::setw(25)
                     << (   row == -2        ?  "        " + s_month_names.at(mo.front().first - 1u)
                   :        row == -1        ?  " Mo Tu We Th Fr Sa Su"
                   : size_t(row) < mo.size() ?  mo[size_t(row)].second
                   :                            "                     ");
            }
            ostr << "\n";
        }
    });
}

int main(int argc, char* argv[])
{
    uint16_t year = 2019;
    size_t num_cols = 3;

    try {
        if(argc > 1) {
            year = boost::numeric_cast<uint16_t>(std::stoi(argv[1]));
        }
        if(argc > 2) {
            num_cols = size_t(std::stoul(argv[2]));
        }
        MakeCalendar(year, num_cols, std::cout);
    } catch(const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [year [months-per-row]]\n"
                  << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
