/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/contracts.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

suite contracts_suite = [] {
    "contracts"_test = [] {
        "names"_test = [] {
            for (const auto kind: contract_kinds)
                expect(contract_kind_from_name(contract_kind_name(kind)) == kind);
            test_same(std::string { "user_replica_set_manager" }, fmt::format("{}", contract_kind::user_replica_set));
            expect(throws([] { contract_kind_from_name("factory"); }));
        };
        "classify is case-insensitive"_test = [] {
            const contract_map cm { contract_addresses {
                { contract_kind::user, "0xAbCdEf0000000000000000000000000000000001" },
                { contract_kind::track, "0xabcdef0000000000000000000000000000000002" }
            } };
            test_same(2, cm.size());
            expect(cm.classify("0xabcdef0000000000000000000000000000000001") == contract_kind::user);
            expect(cm.classify("0xABCDEF0000000000000000000000000000000002") == contract_kind::track);
            expect(!cm.classify("0xabcdef0000000000000000000000000000000003"));
            expect(!cm.classify(""));
        };
        "misconfiguration"_test = [] {
            expect(throws([] {
                contract_map cm { contract_addresses {
                    { contract_kind::user, "0xAA" },
                    { contract_kind::playlist, "0xaa" }
                } };
            }));
            expect(throws([] { contract_map cm { contract_addresses { { contract_kind::user, "" } } }; }));
        };
    };
};
