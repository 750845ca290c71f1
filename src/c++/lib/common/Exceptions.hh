//
// hcrank - Higher Criticism Corpus Ranking
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **/

#pragma once

#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

namespace hcrank
{
namespace common
{

/**
 ** \brief Virtual base class to all the exception classes
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
 **/
class ExceptionData : public boost::exception
{
public:
    ExceptionData(int errorNumber=0, const std::string& message="");
    ExceptionData(const ExceptionData&) = default;
    ExceptionData& operator=(const ExceptionData&) = delete;

    int getErrorNumber() const
    {
        return errorNumber_;
    }
    const std::string& getMessage() const
    {
        return message_;
    }
    std::string getContext() const;
private:
    const int errorNumber_;
    const std::string message_;
};

/**
 ** \brief Exception thrown when the client supplied an invalid parameter.
 **
 ** Used for configuration values outside their valid range.
 **/
class InvalidParameterException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidParameterException(const std::string& message);
};

/**
 ** \brief Exception thrown when count data handed to an operation violates
 ** its input invariants.
 **
 ** Examples are an all-zero count matrix, count vectors of differing
 ** length, or an empty leave-one-out comparison population.
 **/
class InvalidInputException: public std::invalid_argument, public ExceptionData
{
public:
    explicit
    InvalidInputException(const std::string& message);
};

/**
 ** \brief Exception thrown when a candidate treated as a sub-population
 ** of a table has a count exceeding the table's count on some feature.
 **/
class InvalidSubsetRelationException: public std::domain_error, public ExceptionData
{
public:
    explicit
    InvalidSubsetRelationException(const std::string& message);
};

/// General purpose exception for all other cases:
///
struct LogicException: public std::logic_error, public ExceptionData
{
    explicit
    LogicException(const std::string& message) :
        std::logic_error(message),
        ExceptionData(EPERM, message)
    {}
};

}
}
