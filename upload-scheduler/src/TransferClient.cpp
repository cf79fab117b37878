/**
 * @file TransferClient.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/TransferClient.hpp>

// Standard Library Includes
#include <exception>

namespace automation::upload_scheduler
{
ScopedConnection::ScopedConnection(TransferClient& client)
    : m_Client(client)
{
    try
    {
        m_Client.connect();
    }
    catch (const std::exception&)
    {
        // The destructor does not run when the constructor throws
        m_Client.close();
        throw;
    }
}

ScopedConnection::~ScopedConnection()
{
    m_Client.close();
}
} // namespace automation::upload_scheduler
