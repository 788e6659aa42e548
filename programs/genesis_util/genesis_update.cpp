/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include <iostream>
#include <string>

#include <fc/io/fstream.hpp>
#include <fc/io/json.hpp>
#include <fc/exception/exception.hpp>

#include <honzon/chain/config.hpp>
#include <honzon/chain/genesis_state.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace honzon::chain;
namespace bpo = boost::program_options;

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description cli_options("Honzon genesis utility");
      cli_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json,g", bpo::value<boost::filesystem::path>(), "File to read genesis state from, the example genesis is used when omitted")
            ("out,o", bpo::value<boost::filesystem::path>(), "File to output new genesis to")
            ("dev-account-prefix", bpo::value<std::string>()->default_value("devacct"), "Prefix for dev accounts")
            ("dev-account-count", bpo::value<uint32_t>()->default_value(0), "Number of dev accounts to add")
            ("dev-native-amount", bpo::value<uint64_t>()->default_value(uint64_t(1000)*uint64_t(1000)), "Collateral balance of each dev account")
            ("dev-stable-amount", bpo::value<uint64_t>()->default_value(0), "Stable currency balance of each dev account")
            ;

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line(argc, argv, cli_options), options );
      }
      catch (const bpo::error& e)
      {
         std::cerr << "genesis_update:  error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") )
      {
         std::cout << cli_options << "\n";
         return 1;
      }

      if( !options.count( "out" ) )
      {
         std::cerr << "--out option is required\n";
         return 1;
      }

      genesis_state_type genesis;
      if( options.count("genesis-json") )
      {
         fc::path genesis_json_filename = options["genesis-json"].as<boost::filesystem::path>();
         std::cerr << "genesis_update:  Reading genesis from file " << genesis_json_filename.preferred_string() << "\n";
         std::string genesis_json;
         fc::read_file_contents( genesis_json_filename, genesis_json );
         genesis = fc::json::from_string( genesis_json ).as< genesis_state_type >();
      }
      else
      {
         std::cerr << "genesis_update:  Using example genesis\n";
         genesis = create_example_genesis();
      }

      const uint32_t dev_account_count = options["dev-account-count"].as<uint32_t>();
      const std::string dev_account_prefix = options["dev-account-prefix"].as<std::string>();
      const uint64_t dev_native_amount = options["dev-native-amount"].as<uint64_t>();
      const uint64_t dev_stable_amount = options["dev-stable-amount"].as<uint64_t>();
      for( uint32_t i = 0; i < dev_account_count; i++ )
      {
         const std::string name = dev_account_prefix + std::to_string(i);
         genesis.initial_accounts.push_back( genesis_state_type::initial_account_type( name ) );

         if( dev_native_amount > 0 )
         {
            genesis_state_type::initial_account_balances_type bal;
            bal.owner_name = name;
            bal.asset_symbol = HONZON_NATIVE_SYMBOL;
            bal.amount = dev_native_amount;
            genesis.initial_account_balances.push_back( bal );
         }
         if( dev_stable_amount > 0 )
         {
            genesis_state_type::initial_account_balances_type bal;
            bal.owner_name = name;
            bal.asset_symbol = HONZON_STABLE_SYMBOL;
            bal.amount = dev_stable_amount;
            genesis.initial_account_balances.push_back( bal );
         }
      }

      genesis.validate();

      fc::path output_filename = options["out"].as<boost::filesystem::path>();
      fc::json::save_to_file( genesis, output_filename );
   }
   catch ( const fc::exception& e )
   {
      std::cout << e.to_detail_string() << "\n";
      return 1;
   }
   return 0;
}
