#include "include/mork.hpp"
#include <iostream>
#include <iomanip>

using namespace mork;

// The tree a grammar would produce for this address book fragment:
//
//   < <(a=c)> (80=ns:addrbk:db:row:scope:card:all)(81=DisplayName)
//             (82=PrimaryEmail)(83=LastModifiedDate) >
//   <(90=Ada Lovelace)(91=ada@example.org)>
//   {1:^80 [1(^81^90)(^82^91)(^83=5f5e100)]
//          [2(^81=Grace Hopper)(^82=grace$40example.org)(^83=61c88647)] }
//   [1:^80(^81=Ada King)(^82^91)(^83=6553f100)]
//   @$${1{@ ... @$$}1@
syntax::document example_tree()
{
    using syntax::cell;
    using syntax::ref;
    using syntax::oid;

    syntax::document tree;

    syntax::dict columns;
    columns.meta.push_back({ { cell{ std::string("a"), std::string("c") } } });
    columns.cells = {
        cell{ std::string("80"), std::string("ns:addrbk:db:row:scope:card:all") },
        cell{ std::string("81"), std::string("DisplayName") },
        cell{ std::string("82"), std::string("PrimaryEmail") },
        cell{ std::string("83"), std::string("LastModifiedDate") },
    };
    tree.items.push_back(columns);

    syntax::dict values;
    values.cells = {
        cell{ std::string("90"), std::string("Ada Lovelace") },
        cell{ std::string("91"), std::string("ada@example.org") },
    };
    tree.items.push_back(values);

    syntax::row ada;
    ada.id    = oid("1");
    ada.cells = {
        cell{ ref("81"), ref("90") },
        cell{ ref("82"), ref("91") },
        cell{ ref("83"), std::string("5f5e100") },
    };

    syntax::row grace;
    grace.id    = oid("2");
    grace.cells = {
        cell{ ref("81"), std::string("Grace Hopper") },
        cell{ ref("82"), std::string("grace$40example.org") },
        cell{ ref("83"), std::string("61c88647") },
    };

    syntax::table cards;
    cards.id      = oid("1", ref("80"));
    cards.entries = { ada, grace };
    tree.items.push_back(cards);

    syntax::row ada_edit;
    ada_edit.id    = oid("1", ref("80"));
    ada_edit.cells = {
        cell{ ref("81"), std::string("Ada King") },
        cell{ ref("82"), ref("91") },
        cell{ ref("83"), std::string("6553f100") },
    };
    tree.items.push_back(ada_edit);

    tree.items.push_back(syntax::other{ "group" });

    return tree;
}

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_tables(database const & db)
{
    for (auto const & tk : db.table_keys())
    {
        auto t = db.table(tk);
        std::cout << "Table " << to_string(tk) << " (" << t->row_count() << " rows)\n";

        auto columns = t->column_names();
        for (auto const & c : columns)
            std::cout << std::left << std::setw(22) << c;
        std::cout << "\n" << std::string(22 * columns.size(), '-') << "\n";

        for (size_t i = 0; i < t->row_count(); ++i)
        {
            auto r = t->row(i);
            for (auto const & c : columns)
                std::cout << std::left << std::setw(22) << r->value(c).value_or("");
            std::cout << "\n";
        }
    }
}

int main()
{
    print_separator("Building");

    auto ctx = build(example_tree());
    for (auto const & e : ctx.errors)
        std::cout << describe(e) << "\n";

    if (build_failed(ctx))
    {
        std::cout << "cannot interpret file\n";
        return 1;
    }

    std::cout << ctx.result.row_count() << " rows, "
              << ctx.result.table_count() << " tables, "
              << ctx.result.dictionaries().namespace_count() << " dictionaries\n";

    print_separator("Tables as stored");
    print_tables(ctx.result);

    // Dates are stored as hex seconds since the epoch.
    print_separator("Tables with decimal timestamps");
    editor ed(ctx.result);
    ed.rewrite_all_cells([](std::string const & column, std::string & value)
    {
        if (column == "LastModifiedDate")
            value = std::to_string(std::stoul(value, nullptr, 16));
    });
    print_tables(ctx.result);

    return 0;
}
